#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include <vector>

// FW types (on passe par valeur ⇒ on inclut ici)
#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/comparator.hpp>

namespace gui {

// Exécute la comparaison des fonds hors du thread GUI.
// Une comparaison à la fois : le worker vit dans son propre QThread.
class ProjectionWorker : public QObject {
  Q_OBJECT
public:
  explicit ProjectionWorker(QObject* parent = nullptr);
  ~ProjectionWorker() override = default;

public slots:
  void runComparison(std::vector<fw::market::Fund> funds,
                     fw::config::ProjectionParams params);

signals:
  void started(int nFunds);
  void finished(std::shared_ptr<const fw::projection::ComparisonReport> report,
                qint64 ms);
  // Aucun résultat exploitable (tous exclus / tous en échec) ou paramètres refusés
  void failed(const QString& why);
};

} // namespace gui
