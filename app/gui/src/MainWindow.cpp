#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QMessageBox>
#include <QTableWidgetItem>
#include <QMetaObject>
#include <QMetaType>
#include <QStatusBar>
#include <QDebug>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <QVBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QPainter>
#include <QPen>

#include <QCoreApplication>
#include <QFileDialog>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDir>
#include <QDate>
#include <QDateTime>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "ProjectionWorker.hpp"

// FW
#include <fw/core/calendar.hpp>
#include <fw/core/money.hpp>
#include <fw/io/fund_csv.hpp>

namespace {
const QColor C_BALANCE(33,150,243);   // solde (bleu)

enum FundCol { COL_NAME = 0, COL_RATE, COL_FEE, COL_MIN };

QString money(double x) { return QString::fromStdString(fw::core::format_amount(x)); }
QString kes(double x)   { return QString::fromStdString(fw::core::format_currency(x)); }

QTableWidgetItem* numItem(const QString& text) {
  auto* it = new QTableWidgetItem(text);
  it->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
  return it;
}

// Catalogue JSON : { "funds": [ {name, rate, mgt_fee, minimum_investment}, … ] }
QJsonArray fundsToJson(const std::vector<fw::market::Fund>& funds) {
  QJsonArray arr;
  for (const auto& f : funds) {
    arr.append(QJsonObject{
      {"name",               QString::fromStdString(f.name)},
      {"rate",               f.annual_rate},
      {"mgt_fee",            f.annual_fee_rate},
      {"minimum_investment", f.minimum_investment}
    });
  }
  return arr;
}

std::vector<fw::market::Fund> fundsFromJson(const QJsonArray& arr, QStringList* rejected) {
  std::vector<fw::market::Fund> out;
  for (int i = 0; i < arr.size(); ++i) {
    const QJsonObject o = arr.at(i).toObject();
    try {
      out.emplace_back(o["name"].toString().trimmed().toStdString(),
                       o["rate"].toDouble(),
                       o["mgt_fee"].toDouble(0.0),
                       o["minimum_investment"].toDouble(0.0));
    } catch (const std::invalid_argument& e) {
      if (rejected) rejected->append(QString("Entry %1: %2").arg(i + 1).arg(e.what()));
    }
  }
  return out;
}
} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  // Enregistrements pour les queued connections
  qRegisterMetaType<std::shared_ptr<const fw::projection::ComparisonReport>>(
      "std::shared_ptr<const fw::projection::ComparisonReport>");

  // Label "project" en barre d’état
  projectLabel_ = new QLabel(this);
  projectLabel_->setObjectName("lblProjectName");
  statusBar()->addPermanentWidget(projectLabel_, /*stretch*/1);
  setCurrentProject(QString());

  ui->deStart->setDate(QDate::currentDate());
  ui->tblFunds->horizontalHeader()->setSectionResizeMode(COL_NAME, QHeaderView::Stretch);
  ui->tblResults->horizontalHeader()->setSectionResizeMode(0, QHeaderView::Stretch);
  ui->tblMonthly->horizontalHeader()->setSectionResizeMode(0, QHeaderView::Stretch);

  setupBalanceChart();
  wireSignals();
  startWorker();

  // Catalogue de départ : data/funds/funds.csv si présent, sinon défauts
  std::vector<std::string> warns;
  const QString catalog = QDir(projectsDir()).absoluteFilePath("../funds/funds.csv");
  setFunds(fw::io::load_fund_catalog(QDir::cleanPath(catalog).toStdString(), &warns));
  for (const auto& w : warns) log(QString("[warn] %1").arg(QString::fromStdString(w)));
}

MainWindow::~MainWindow() {
  stopWorker();

  // La vue possède son QChart
  delete balanceChartView_; balanceChartView_ = nullptr;
  balanceChart_ = nullptr; balanceSeries_ = nullptr; axX_ = nullptr; axY_ = nullptr;

  delete ui;
}

void MainWindow::wireSignals() {
  connect(ui->btnRun,          &QPushButton::clicked, this, &MainWindow::onRun);
  connect(ui->btnLoadDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  connect(ui->btnLoadFunds,    &QPushButton::clicked, this, &MainWindow::onLoadFunds);
  connect(ui->btnAddFund,      &QPushButton::clicked, this, &MainWindow::onAddFund);
  connect(ui->btnRemoveFund,   &QPushButton::clicked, this, &MainWindow::onRemoveFund);
  connect(ui->btnSaveProject,  &QPushButton::clicked, this, &MainWindow::onSaveProject);
  connect(ui->btnLoadProject,  &QPushButton::clicked, this, &MainWindow::onLoadProject);
}

void MainWindow::startWorker() {
  if (workerThread_ && worker_) return;

  workerThread_ = new QThread(this);
  worker_       = new gui::ProjectionWorker();   // PAS de parent → il vivra dans workerThread_
  worker_->moveToThread(workerThread_);

  connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);

  // Worker -> GUI : Qt::QueuedConnection (inter-threads)
  connect(worker_, &gui::ProjectionWorker::finished,
          this, &MainWindow::onComparisonFinished, Qt::QueuedConnection);
  connect(worker_, &gui::ProjectionWorker::failed,
          this, &MainWindow::onComparisonFailed, Qt::QueuedConnection);
  connect(worker_, &gui::ProjectionWorker::started, this, [this](int n){
    statusBar()->showMessage(QString("Comparing %1 fund(s)…").arg(n));
  }, Qt::QueuedConnection);

  workerThread_->start();
}

void MainWindow::stopWorker() {
  if (!workerThread_) return;

  if (worker_) QObject::disconnect(worker_, nullptr, this, nullptr);

  workerThread_->quit();
  workerThread_->wait();

  // deleteLater(worker_) est déjà connecté sur finished du thread
  workerThread_ = nullptr;
  worker_       = nullptr;
}

// ======================= Chart =======================
void MainWindow::setupBalanceChart() {
  if (balanceChartView_) return;

  using namespace QtCharts;

  balanceChart_ = new QChart();
  balanceChart_->legend()->setVisible(false);
  balanceChart_->setTitle("Balance (best fund)");

  axX_ = new QValueAxis(balanceChart_);
  axY_ = new QValueAxis(balanceChart_);
  axX_->setTitleText("Month");
  axY_->setTitleText("Balance (KES)");
  axX_->setLabelFormat("%.0f");
  axY_->setLabelFormat("%.2f");
  balanceChart_->addAxis(axX_, Qt::AlignBottom);
  balanceChart_->addAxis(axY_, Qt::AlignLeft);

  balanceSeries_ = new QLineSeries(balanceChart_);
  balanceSeries_->setPen(QPen(C_BALANCE, 2));
  balanceSeries_->setPointsVisible(true);
  balanceChart_->addSeries(balanceSeries_);
  balanceSeries_->attachAxis(axX_);
  balanceSeries_->attachAxis(axY_);

  balanceChartView_ = new QChartView(balanceChart_, ui->chartContainer);
  balanceChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(ui->chartContainer);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(balanceChartView_);
}

void MainWindow::plotBalances(const fw::projection::ProjectionResult& best) {
  setupBalanceChart();
  balanceSeries_->clear();
  balanceChart_->setTitle(QString("Balance: %1").arg(QString::fromStdString(best.fund_name)));

  double lo = best.monthly_balances.front().balance, hi = lo;
  for (std::size_t k = 0; k < best.monthly_balances.size(); ++k) {
    const double b = best.monthly_balances[k].balance;
    balanceSeries_->append(static_cast<double>(k), b);
    lo = std::min(lo, b);
    hi = std::max(hi, b);
  }
  const double pad = std::max(1.0, 0.05 * (hi - lo));
  axX_->setRange(0.0, static_cast<double>(best.monthly_balances.size() - 1));
  axY_->setRange(lo - pad, hi + pad);
}

// ======================= Formulaire =======================
fw::config::ProjectionParams MainWindow::readParams() const {
  const QDate d = ui->deStart->date();
  return fw::config::ProjectionParams(
      ui->sbInitialCapital->value(),
      ui->sbMonthly->value(),
      ui->sbMonths->value(),
      ui->sbTax->value(),
      ui->chkFees->isChecked(),
      fw::core::Date{d.year(), d.month(), d.day()},
      ui->chkDailyRounding->isChecked() ? fw::config::InterestRounding::DailyToCent
                                        : fw::config::InterestRounding::None,
      /*keep_daily_series=*/false);
}

std::vector<fw::market::Fund> MainWindow::readFunds(QStringList* rejected) const {
  std::vector<fw::market::Fund> out;
  auto cell = [this](int r, int c) -> QString {
    const QTableWidgetItem* it = ui->tblFunds->item(r, c);
    return it ? it->text().trimmed() : QString();
  };
  // Même lecture que le catalogue CSV ; frais et minimum vides ⇒ 0
  auto num = [](const QString& s, double dflt, bool* ok) -> double {
    if (s.isEmpty()) { *ok = true; return dflt; }
    const double v = fw::io::parse_decimal_field(s.toStdString());
    *ok = std::isfinite(v);
    return v;
  };

  for (int r = 0; r < ui->tblFunds->rowCount(); ++r) {
    const QString name = cell(r, COL_NAME);
    bool okRate = false, okFee = false, okMin = false;
    const double rate = num(cell(r, COL_RATE), 0.0, &okRate);
    const double fee  = num(cell(r, COL_FEE),  0.0, &okFee);
    const double mini = num(cell(r, COL_MIN),  0.0, &okMin);
    if (!okRate || !okFee || !okMin) {
      if (rejected) rejected->append(QString("Row %1 (%2): not a number").arg(r + 1).arg(name));
      continue;
    }
    try {
      out.emplace_back(name.toStdString(), rate, fee, mini);
    } catch (const std::invalid_argument& e) {
      if (rejected) rejected->append(QString("Row %1: %2").arg(r + 1).arg(e.what()));
    }
  }
  return out;
}

void MainWindow::appendFundRow(const QString& name, double rate, double fee, double minimum) {
  const int r = ui->tblFunds->rowCount();
  ui->tblFunds->insertRow(r);
  ui->tblFunds->setItem(r, COL_NAME, new QTableWidgetItem(name));
  // Valeurs écrites sans perte : readFunds() relit exactement le catalogue
  auto field = [](double v) { return QString::fromStdString(fw::io::format_decimal_field(v)); };
  ui->tblFunds->setItem(r, COL_RATE, numItem(field(rate)));
  ui->tblFunds->setItem(r, COL_FEE,  numItem(field(fee)));
  ui->tblFunds->setItem(r, COL_MIN,  numItem(field(minimum)));
}

void MainWindow::setFunds(const std::vector<fw::market::Fund>& funds) {
  ui->tblFunds->setRowCount(0);
  for (const auto& f : funds)
    appendFundRow(QString::fromStdString(f.name), f.annual_rate, f.annual_fee_rate, f.minimum_investment);
}

void MainWindow::onAddFund() {
  appendFundRow(QString("New fund %1").arg(ui->tblFunds->rowCount() + 1), 10.0, 0.0, 0.0);
  ui->tblFunds->setCurrentCell(ui->tblFunds->rowCount() - 1, COL_NAME);
}

void MainWindow::onRemoveFund() {
  const int r = ui->tblFunds->currentRow();
  if (r >= 0) ui->tblFunds->removeRow(r);
}

void MainWindow::onLoadDefaults() {
  setFunds(fw::io::default_funds());
  statusBar()->showMessage("Default catalog loaded.", 1500);
}

void MainWindow::onLoadFunds() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load fund catalog"), QDir(projectsDir()).absoluteFilePath("../funds"),
      tr("Catalogs (*.csv *.json)"));
  if (fn.isEmpty()) return;

  std::vector<fw::market::Fund> funds;
  if (QFileInfo(fn).suffix().toLower() == "csv") {
    std::size_t ignored = 0;
    std::vector<std::string> warns;
    funds = fw::io::read_fund_csv(fn.toStdString(), &ignored, &warns);
    for (const auto& w : warns) log(QString("[warn] %1").arg(QString::fromStdString(w)));
    qDebug() << "[UI] catalog csv" << fn << "funds=" << funds.size() << "ignored=" << ignored;
  } else {
    QFile f(fn);
    if (!f.open(QIODevice::ReadOnly)) {
      QMessageBox::warning(this, tr("Load fund catalog"), tr("Cannot open file for reading."));
      return;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll());
    f.close();
    if (!doc.isObject()) {
      QMessageBox::warning(this, tr("Load fund catalog"), tr("Invalid JSON file."));
      return;
    }
    QStringList rejected;
    funds = fundsFromJson(doc.object().value("funds").toArray(), &rejected);
    for (const auto& r : rejected) log("[warn] " + r);
    qDebug() << "[UI] catalog json" << fn << "funds=" << funds.size() << "rejected=" << rejected.size();
  }

  if (funds.empty()) {
    QMessageBox::warning(this, tr("Load fund catalog"), tr("No valid fund in %1.").arg(fn));
    return;
  }
  setFunds(funds);
  statusBar()->showMessage(tr("%1 fund(s) loaded.").arg(funds.size()), 2000);
}

// ======================= Comparaison =======================
void MainWindow::onRun() {
  if (busy_) {
    statusBar()->showMessage("A comparison is already running.", 1500);
    return;
  }

  QStringList rejected;
  std::vector<fw::market::Fund> funds = readFunds(&rejected);
  for (const auto& r : rejected) log("[warn] " + r);

  if (funds.empty()) {
    QMessageBox::warning(this, "Compare", "No valid fund to compare.");
    return;
  }

  try {
    const fw::config::ProjectionParams params = readParams();
    clearResults();
    lastRunFees_ = params.apply_management_fee;
    busy_ = true;
    ui->btnRun->setEnabled(false);

    qDebug() << "[UI→Worker] runComparison funds=" << funds.size();
    QMetaObject::invokeMethod(
      worker_,
      [w=worker_, funds=std::move(funds), params]() { w->runComparison(funds, params); },
      Qt::QueuedConnection
    );
  } catch (const std::invalid_argument& e) {
    QMessageBox::warning(this, "Invalid parameters", QString::fromStdString(e.what()));
  }
}

void MainWindow::onComparisonFinished(std::shared_ptr<const fw::projection::ComparisonReport> report,
                                      qint64 ms) {
  busy_ = false;
  ui->btnRun->setEnabled(true);
  if (!report) return;

  lastReport_ = std::move(report);
  showReport(*lastReport_);
  statusBar()->showMessage(QString("Comparison done (%1 ms).").arg(ms), 3000);
}

void MainWindow::onComparisonFailed(const QString& why) {
  busy_ = false;
  ui->btnRun->setEnabled(true);
  log("[error] " + why);
  statusBar()->showMessage("Comparison failed.", 3000);
  QMessageBox::warning(this, "Compare", why);
}

void MainWindow::clearResults() {
  lastReport_.reset();
  ui->tblResults->setRowCount(0);
  ui->tblMonthly->setRowCount(0);
  ui->lblBestFund->setText("-");
  if (balanceSeries_) balanceSeries_->clear();
}

void MainWindow::showReport(const fw::projection::ComparisonReport& rep) {
  for (const auto& n : rep.excluded)
    log(QString("[excluded] %1: %2").arg(QString::fromStdString(n.fund.name),
                                         QString::fromStdString(n.reason)));
  for (const auto& n : rep.warnings)
    log(QString("[warn] %1").arg(QString::fromStdString(n.reason)));

  fillResultsTable(rep);
  if (rep.ranked.empty()) return;

  const auto& best = rep.ranked.front();
  QString header = QString("Best fund: %1 (%2% p.a.")
                     .arg(QString::fromStdString(best.fund.name))
                     .arg(best.fund.annual_rate, 0, 'f', 2);
  if (lastRunFees_)
    header += QString(", fee %1%").arg(best.fund.annual_fee_rate, 0, 'f', 2);
  header += QString(")  Final balance %1").arg(kes(best.result.final_balance));
  ui->lblBestFund->setText(header);

  fillMonthlyTable(best.result);
  plotBalances(best.result);
}

void MainWindow::fillResultsTable(const fw::projection::ComparisonReport& rep) {
  ui->tblResults->setRowCount(static_cast<int>(rep.ranked.size()));
  for (int r = 0; r < static_cast<int>(rep.ranked.size()); ++r) {
    const auto& e = rep.ranked[static_cast<std::size_t>(r)];
    ui->tblResults->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(e.fund.name)));
    ui->tblResults->setItem(r, 1, numItem(QString::number(e.fund.annual_rate, 'f', 2)));
    ui->tblResults->setItem(r, 2, numItem(money(e.result.final_balance)));
    ui->tblResults->setItem(r, 3, numItem(money(e.result.total_interest)));
    ui->tblResults->setItem(r, 4, numItem(money(e.result.total_fees)));
    ui->tblResults->setItem(r, 5, numItem(QString::number(e.result.net_return_percent, 'f', 2)));
  }
}

void MainWindow::fillMonthlyTable(const fw::projection::ProjectionResult& best) {
  ui->tblMonthly->setRowCount(static_cast<int>(best.periods.size()));
  for (int r = 0; r < static_cast<int>(best.periods.size()); ++r) {
    const auto& p = best.periods[static_cast<std::size_t>(r)];
    ui->tblMonthly->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(p.label)));
    ui->tblMonthly->setItem(r, 1, numItem(QString::number(p.days)));
    ui->tblMonthly->setItem(r, 2, numItem(money(p.opening_balance)));
    ui->tblMonthly->setItem(r, 3, numItem(money(p.contribution)));
    ui->tblMonthly->setItem(r, 4, numItem(money(p.interest)));
    ui->tblMonthly->setItem(r, 5, numItem(money(p.fee)));
    ui->tblMonthly->setItem(r, 6, numItem(money(p.closing_balance)));
  }
}

void MainWindow::log(const QString& line) {
  ui->txtLog->appendPlainText(
      QDateTime::currentDateTime().toString("HH:mm:ss") + "  " + line);
}

// ======================= Projet JSON =======================
QJsonObject MainWindow::makeProjectJson() const {
  QJsonObject params{
    {"initial_capital",      ui->sbInitialCapital->value()},
    {"monthly_contribution", ui->sbMonthly->value()},
    {"months",               ui->sbMonths->value()},
    {"withholding_tax",      ui->sbTax->value()},
    {"apply_fees",           ui->chkFees->isChecked()},
    {"daily_rounding",       ui->chkDailyRounding->isChecked()},
    {"start_date",           ui->deStart->date().toString("yyyy-MM-dd")}
  };

  QStringList rejected;
  const auto funds = readFunds(&rejected);

  return QJsonObject{
    {"params", params},
    {"funds",  fundsToJson(funds)},
    {"saved_at", QDateTime::currentDateTime().toString(Qt::ISODate)}
  };
}

void MainWindow::loadProjectJson(const QJsonObject& root) {
  if (const QJsonObject p = root["params"].toObject(); !p.isEmpty()) {
    ui->sbInitialCapital->setValue(p["initial_capital"].toDouble(ui->sbInitialCapital->value()));
    ui->sbMonthly->setValue(p["monthly_contribution"].toDouble(ui->sbMonthly->value()));
    ui->sbMonths->setValue(p["months"].toInt(ui->sbMonths->value()));
    ui->sbTax->setValue(p["withholding_tax"].toDouble(ui->sbTax->value()));
    ui->chkFees->setChecked(p["apply_fees"].toBool(ui->chkFees->isChecked()));
    ui->chkDailyRounding->setChecked(p["daily_rounding"].toBool(ui->chkDailyRounding->isChecked()));

    const QString iso = p["start_date"].toString();
    if (!iso.isEmpty()) {
      try {
        const auto d = fw::core::parse_iso_date(iso.toStdString());
        ui->deStart->setDate(QDate(d.year, d.month, d.day));
      } catch (const std::invalid_argument& e) {
        log(QString("[warn] start_date ignored: %1").arg(e.what()));
      }
    }
  }

  if (root.contains("funds")) {
    QStringList rejected;
    const auto funds = fundsFromJson(root["funds"].toArray(), &rejected);
    for (const auto& r : rejected) log("[warn] " + r);
    setFunds(funds);
  }
  clearResults();
}

void MainWindow::onSaveProject() {
  const QString dir = projectsDir();
  QDir().mkpath(dir);

  const QString suggested = dir + "/project_" +
      QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss") + ".json";

  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Save project"), suggested, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    QMessageBox::warning(this, tr("Save project"), tr("Cannot open file for writing."));
    return;
  }
  QJsonDocument doc(makeProjectJson());
  f.write(doc.toJson(QJsonDocument::Indented));
  f.close();
  setCurrentProject(fn);
  statusBar()->showMessage(tr("Project saved to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

void MainWindow::onLoadProject() {
  const QString dir = projectsDir();
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load project"), dir, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::ReadOnly)) {
    QMessageBox::warning(this, tr("Load project"), tr("Cannot open file for reading."));
    return;
  }
  const QByteArray bytes = f.readAll(); f.close();
  const QJsonDocument doc = QJsonDocument::fromJson(bytes);
  if (!doc.isObject()) {
    QMessageBox::warning(this, tr("Load project"), tr("Invalid JSON file."));
    return;
  }
  loadProjectJson(doc.object());
  setCurrentProject(fn);
  qDebug() << "[UI] project loaded -> funds =" << ui->tblFunds->rowCount();
  statusBar()->showMessage(tr("Project loaded from %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

QString MainWindow::projectsDir() const {
  // Point de départ = dossier de l'exécutable (…/build/bin)
  QDir exeDir(QCoreApplication::applicationDirPath());

  const QStringList candidates = {
    exeDir.absoluteFilePath("../data/projects"),
    exeDir.absoluteFilePath("../../data/projects"),
    QDir::current().absoluteFilePath("data/projects")
  };

  for (const QString& c : candidates) {
    if (QDir(c).exists())
      return QDir::cleanPath(c);
  }

  const QString target = QDir::cleanPath(candidates.front());
  QDir().mkpath(target);
  return target;
}

void MainWindow::setCurrentProject(const QString& path) {
  currentProjectPath_ = path;
  const QString name = path.isEmpty() ? QString("No project") : QFileInfo(path).fileName();
  if (projectLabel_) projectLabel_->setText(name);

  QString base = "FundWorkbench";
  if (!path.isEmpty()) base += " - " + name;
  setWindowTitle(base);
}
