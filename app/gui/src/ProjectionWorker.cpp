#include "ProjectionWorker.hpp"

#include <chrono>
#include <exception>

#include <QDebug>

namespace gui {

ProjectionWorker::ProjectionWorker(QObject* parent) : QObject(parent) {}

void ProjectionWorker::runComparison(std::vector<fw::market::Fund> funds,
                                     fw::config::ProjectionParams params)
{
  emit started(static_cast<int>(funds.size()));

  qDebug() << "[runComparison]"
           << "funds=" << funds.size()
           << "capital=" << params.initial_capital
           << "monthly=" << params.monthly_contribution
           << "months=" << params.horizon_months
           << "tax%=" << params.withholding_tax_percent
           << "fees=" << params.apply_management_fee;

  const auto t0 = std::chrono::steady_clock::now();
  try {
    auto rep = std::make_shared<const fw::projection::ComparisonReport>(
        fw::projection::compare(funds, params));
    const auto t1 = std::chrono::steady_clock::now();
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    qDebug() << "[runComparison] ranked=" << rep->ranked.size()
             << "excluded=" << rep->excluded.size()
             << "warnings=" << rep->warnings.size()
             << "ms=" << ms;
    emit finished(rep, ms);
  } catch (const fw::projection::NoResultsError& e) {
    qDebug() << "[runComparison] no results:" << e.what();
    emit failed(QString::fromStdString(e.what()));
  } catch (const std::exception& e) {
    qWarning() << "[runComparison] failed:" << e.what();
    emit failed(QString("Comparison failed: %1").arg(e.what()));
  }
}

} // namespace gui
