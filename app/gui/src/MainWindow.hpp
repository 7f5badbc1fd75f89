#pragma once
#include <QMainWindow>
#include <QThread>
#include <QJsonObject>
#include <QString>
#include <memory>
#include <vector>

#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/comparator.hpp>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

namespace gui { class ProjectionWorker; }

namespace QtCharts {
  class QChartView;
  class QChart;
  class QLineSeries;
  class QValueAxis;
}

class QLabel;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRun();
  void onLoadDefaults();
  void onLoadFunds();
  void onAddFund();
  void onRemoveFund();

  // Callbacks worker
  void onComparisonFinished(std::shared_ptr<const fw::projection::ComparisonReport> report,
                            qint64 ms);
  void onComparisonFailed(const QString& why);

  void onSaveProject();
  void onLoadProject();

private:
  Ui::MainWindow* ui = nullptr;

  // Worker + thread
  QThread* workerThread_ = nullptr;
  gui::ProjectionWorker* worker_ = nullptr;
  bool busy_ = false;
  bool lastRunFees_ = true;

  // Chart (solde du meilleur fonds)
  QtCharts::QChartView*  balanceChartView_ = nullptr;
  QtCharts::QChart*      balanceChart_ = nullptr;
  QtCharts::QLineSeries* balanceSeries_ = nullptr;
  QtCharts::QValueAxis*  axX_ = nullptr;
  QtCharts::QValueAxis*  axY_ = nullptr;

  QLabel* projectLabel_ = nullptr;
  QString currentProjectPath_;

  // Dernier rapport reçu (partagé, immuable)
  std::shared_ptr<const fw::projection::ComparisonReport> lastReport_;

  void wireSignals();
  void startWorker();
  void stopWorker();
  void setupBalanceChart();

  // Formulaire ⇄ domaine
  fw::config::ProjectionParams readParams() const;
  std::vector<fw::market::Fund> readFunds(QStringList* rejected) const;
  void setFunds(const std::vector<fw::market::Fund>& funds);
  void appendFundRow(const QString& name, double rate, double fee, double minimum);

  // Affichage
  void showReport(const fw::projection::ComparisonReport& rep);
  void fillResultsTable(const fw::projection::ComparisonReport& rep);
  void fillMonthlyTable(const fw::projection::ProjectionResult& best);
  void plotBalances(const fw::projection::ProjectionResult& best);
  void clearResults();
  void log(const QString& line);

  // Projet JSON
  QJsonObject makeProjectJson() const;
  void loadProjectJson(const QJsonObject& root);
  QString projectsDir() const;
  void setCurrentProject(const QString& path);
};
