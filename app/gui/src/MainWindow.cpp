#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QMessageBox>
#include <QTableWidgetItem>
#include <QMetaObject>
#include <QMetaType>
#include <QStatusBar>
#include <QSignalBlocker>
#include <QDebug>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <QVBoxLayout>
#include <QHeaderView>
#include <QPainter>

#include <QCoreApplication>
#include <QFileDialog>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDir>
#include <QDateTime>

#include <algorithm>
#include <cmath>
#include <limits>

#include <bw/market/yield_spec.hpp>
#include <bw/variants/credit.hpp>

namespace {
const QColor C_LINEAR (33,150,243);   // approx. linéaire (bleu)
const QColor C_CONVEX (255,193,7);    // approx. convexité (ambre)
const QColor C_EXACT  (76,175,80);    // reprice exact (vert)

const double NaN = std::numeric_limits<double>::quiet_NaN();

// Affiche un double, "-" si non fini
QString fmt(double v, int prec = 4) {
  return std::isfinite(v) ? QString::number(v, 'f', prec) : QString("-");
}

// Chocs saisis en % (taux, inflation) ou en bp (spread)
double shockUnit(bw::market::ShockAxis axis) {
  return axis == bw::market::ShockAxis::Spread ? 10000.0 : 100.0;
}

QString kindKey(bw::market::BondKind k) {
  switch (k) {
    case bw::market::BondKind::InflationLinked: return "inflation";
    case bw::market::BondKind::Corporate:       return "corporate";
    default:                                    return "nominal";
  }
}
} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  // Enregistrements pour les queued connections
  qRegisterMetaType<gui::BondAnalysis>("gui::BondAnalysis");
  qRegisterMetaType<bw::scenario::ScenarioTable>("bw::scenario::ScenarioTable");
  wireSignals();

  // Label "project" en barre d’état
  projectLabel_ = new QLabel(this);
  projectLabel_->setObjectName("lblProjectName");
  statusBar()->addPermanentWidget(projectLabel_, /*stretch*/1);
  setCurrentProject(QString(), false);

  ui->tblScenario->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  setupScenarioChart();

  onKindChanged(ui->cbKind->currentIndex());
  startWorker();
}

MainWindow::~MainWindow() {
  stopWorker();
  delete scenChartView_; scenChartView_ = nullptr;
  delete ui;
}

void MainWindow::wireSignals() {
  connect(ui->btnAnalyze,     &QPushButton::clicked, this, &MainWindow::onAnalyze);
  connect(ui->btnRunScenario, &QPushButton::clicked, this, &MainWindow::onRunScenario);
  connect(ui->btnExportCsv,   &QPushButton::clicked, this, &MainWindow::onExportCsv);
  connect(ui->btnLoadCsv,     &QPushButton::clicked, this, &MainWindow::onLoadCsv);
  connect(ui->btnReset,       &QPushButton::clicked, this, &MainWindow::onReset);
  connect(ui->btnSaveProject, &QPushButton::clicked, this, &MainWindow::onSaveProject);
  connect(ui->btnLoadProject, &QPushButton::clicked, this, &MainWindow::onLoadProject);

  connect(ui->cbBond, QOverload<int>::of(&QComboBox::activated),
          this, &MainWindow::onBondSelected);
  connect(ui->cbKind, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &MainWindow::onKindChanged);

  // Toute modification de saisie rend le projet "dirty"
  for (auto* sb : findChildren<QDoubleSpinBox*>())
    connect(sb, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, [this]{ markProjectDirty(); });
  for (auto* sb : findChildren<QSpinBox*>())
    connect(sb, QOverload<int>::of(&QSpinBox::valueChanged),
            this, [this]{ markProjectDirty(); });
  connect(ui->leShocks, &QLineEdit::textEdited, this, [this]{ markProjectDirty(); });
}

// ===================== Worker =====================

void MainWindow::startWorker() {
  if (workerThread_ && worker_) return;

  qRegisterMetaType<long long>("long long");

  workerThread_ = new QThread(this);
  worker_       = new gui::BondWorker();      // PAS de parent → il vivra dans workerThread_
  worker_->moveToThread(workerThread_);

  connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);

  connect(worker_, &gui::BondWorker::analyzed,         this, &MainWindow::onAnalyzed,         Qt::QueuedConnection);
  connect(worker_, &gui::BondWorker::scenarioFinished, this, &MainWindow::onScenarioFinished, Qt::QueuedConnection);
  connect(worker_, &gui::BondWorker::failed,           this, &MainWindow::onWorkerFailed,     Qt::QueuedConnection);

  workerThread_->start();
}

void MainWindow::stopWorker() {
  if (!workerThread_) return;

  if (worker_) {
    QObject::disconnect(worker_, nullptr, this, nullptr);
    QMetaObject::invokeMethod(worker_, "requestStop", Qt::QueuedConnection);
  }

  workerThread_->quit();
  workerThread_->wait(3000);

  // deleteLater(worker_) est déjà connecté sur finished du thread
  workerThread_->deleteLater();
  workerThread_ = nullptr;
  worker_       = nullptr;
}

void MainWindow::setBusy(bool on) {
  busy_ = on;
  ui->btnAnalyze->setEnabled(!on);
  ui->btnRunScenario->setEnabled(!on);
}

// ===================== Saisie =====================

bw::io::BondRow MainWindow::rowFromUi() const {
  bw::io::BondRow row;
  row.name = ui->cbBond->currentText().trimmed().toStdString();
  switch (ui->cbKind->currentIndex()) {
    case 1:  row.kind = bw::market::BondKind::InflationLinked; break;
    case 2:  row.kind = bw::market::BondKind::Corporate;       break;
    default: row.kind = bw::market::BondKind::Nominal;         break;
  }
  row.coupon_pct = ui->dsbCoupon->value();
  row.face       = ui->dsbFace->value();
  row.freq       = ui->sbFreq->value();
  row.maturity   = ui->dsbMaturity->value();
  row.stub       = ui->chkShortFirst->isChecked() ? bw::market::FractionalPeriod::ShortFirst
                                                  : bw::market::FractionalPeriod::Reject;

  const bool byPrice = (ui->cbQuote->currentIndex() == 0);
  if (byPrice) row.price = ui->dsbPrice->value();
  // Corporate coté en prix : le rendement saisi sert de taux de base (spread implicite)
  if (!byPrice || row.kind == bw::market::BondKind::Corporate) row.yield_pct = ui->dsbYield->value();

  row.spread_bps    = ui->dsbSpreadBps->value();
  row.recovery      = ui->dsbRecovery->value();
  row.base_index    = ui->dsbBaseIndex->value();
  row.current_index = ui->dsbCurrentIndex->value();
  row.lag_months    = ui->sbLag->value();
  row.inflation_pct = ui->dsbInflation->value();
  return row;
}

void MainWindow::applyRowToUi(const bw::io::BondRow& row) {
  const int kindIdx = (row.kind == bw::market::BondKind::InflationLinked) ? 1
                    : (row.kind == bw::market::BondKind::Corporate)       ? 2 : 0;
  ui->cbKind->setCurrentIndex(kindIdx);
  ui->dsbCoupon->setValue(row.coupon_pct);
  ui->dsbFace->setValue(row.face);
  ui->sbFreq->setValue(row.freq);
  ui->dsbMaturity->setValue(row.maturity);
  ui->chkShortFirst->setChecked(row.stub == bw::market::FractionalPeriod::ShortFirst);

  const bool hasPrice = std::isfinite(row.price);
  ui->cbQuote->setCurrentIndex(hasPrice ? 0 : 1);
  if (hasPrice) ui->dsbPrice->setValue(row.price);
  if (std::isfinite(row.yield_pct)) ui->dsbYield->setValue(row.yield_pct);

  ui->dsbSpreadBps->setValue(row.spread_bps);
  ui->dsbRecovery->setValue(row.recovery);
  ui->dsbBaseIndex->setValue(row.base_index);
  ui->dsbCurrentIndex->setValue(row.current_index);
  ui->sbLag->setValue(row.lag_months);
  ui->dsbInflation->setValue(row.inflation_pct);
}

bw::config::EngineConfig MainWindow::engineConfigFromUi() const {
  bw::config::EngineConfig cfg;
  cfg.scenario.workers = static_cast<std::size_t>(ui->sbWorkers->value());
  return cfg;
}

bw::market::ShockAxis MainWindow::axisFromUi() const {
  switch (ui->cbAxis->currentIndex()) {
    case 1:  return bw::market::ShockAxis::Spread;
    case 2:  return bw::market::ShockAxis::Inflation;
    default: return bw::market::ShockAxis::Rate;
  }
}

std::vector<double> MainWindow::shocksFromUi(bool* ok) const {
  std::vector<double> out;
  *ok = true;
  const double unit = shockUnit(axisFromUi());
  const QStringList parts = ui->leShocks->text().split(',', QString::SkipEmptyParts);
  for (const QString& p : parts) {
    bool good = false;
    const double v = p.trimmed().toDouble(&good);
    if (!good || !std::isfinite(v)) { *ok = false; return {}; }
    out.push_back(v / unit);
  }
  return out;
}

void MainWindow::onKindChanged(int index) {
  const bool linker = (index == 1);
  const bool corp   = (index == 2);
  ui->dsbSpreadBps->setEnabled(corp);
  ui->dsbRecovery->setEnabled(corp);
  ui->dsbBaseIndex->setEnabled(linker);
  ui->dsbCurrentIndex->setEnabled(linker);
  ui->sbLag->setEnabled(linker);
  ui->dsbInflation->setEnabled(linker);
  ui->dsbNominalYield->setEnabled(linker);
  markProjectDirty();
}

void MainWindow::clearResults() {
  for (QLabel* L : { ui->lblPrice, ui->lblYield, ui->lblSpread, ui->lblMD, ui->lblMac,
                     ui->lblConv, ui->lblDV01, ui->lblSpreadDur, ui->lblInflDur,
                     ui->lblParShift, ui->lblDefaultProb, ui->lblBreakeven })
    L->setText("-");
}

void MainWindow::onReset() {
  // UST 1.25 % 2050 coté 50.036
  bw::io::BondRow row;
  row.name       = "";
  row.coupon_pct = 1.25;
  row.maturity   = 26.2;
  row.stub       = bw::market::FractionalPeriod::ShortFirst;
  row.price      = 50.036;
  row.yield_pct  = 4.79;
  row.spread_bps = 85.0;
  applyRowToUi(row);
  ui->dsbNominalYield->setValue(4.45);
  ui->leShocks->setText("-4,-3,-2,-1,-0.5,0.5,1,2,3,4");
  ui->cbAxis->setCurrentIndex(0);
  ui->sbWorkers->setValue(1);
  clearResults();
  ui->tblScenario->setRowCount(0);
  lastTable_.reset();
  setupScenarioChart();
  linearSeries_->clear(); convexSeries_->clear(); exactSeries_->clear();
  statusBar()->showMessage(tr("Inputs reset."), 1500);
}

// ===================== Analyse =====================

void MainWindow::onAnalyze() {
  if (busy_) return;
  startWorker();

  const bw::io::BondRow row = rowFromUi();
  const bw::config::EngineConfig cfg = engineConfigFromUi();
  const double nominalYield = ui->dsbNominalYield->isEnabled()
                            ? ui->dsbNominalYield->value() / 100.0 : NaN;

  qDebug() << "[UI] analyze" << "kind=" << ui->cbKind->currentText()
           << "coupon=" << row.coupon_pct << "T=" << row.maturity << "f=" << row.freq;

  setBusy(true);
  statusBar()->showMessage(tr("Analyzing…"));
  auto* w = worker_;
  QMetaObject::invokeMethod(w, [w, row, cfg, nominalYield]{
    w->analyze(row, cfg, nominalYield);
  }, Qt::QueuedConnection);
}

void MainWindow::onAnalyzed(const gui::BondAnalysis& r, long long ms) {
  setBusy(false);
  const bool corp   = r.risk.credit_spread_duration.has_value();
  const bool linker = r.risk.inflation_duration.has_value();

  ui->lblPrice->setText(fmt(r.risk.price));
  if (linker)
    ui->lblYield->setText(tr("%1 % real, %2 % infl.").arg(fmt(100.0 * r.spec.rate))
                                                     .arg(fmt(100.0 * r.spec.inflation)));
  else if (corp)
    ui->lblYield->setText(tr("%1 % (base %2 %)").arg(fmt(100.0 * (r.spec.rate + r.spec.credit_spread)))
                                               .arg(fmt(100.0 * r.spec.rate)));
  else
    ui->lblYield->setText(fmt(100.0 * r.spec.rate) + " %");

  ui->lblSpread->setText(corp ? fmt(bw::variants::fraction_to_bps(r.spec.credit_spread), 2) + " bp" : "-");
  ui->lblMD->setText(fmt(r.risk.modified_duration));
  ui->lblMac->setText(fmt(r.risk.macaulay_duration));
  ui->lblConv->setText(fmt(r.risk.convexity));
  ui->lblDV01->setText(fmt(r.risk.dv01, 6));
  ui->lblSpreadDur->setText(r.risk.credit_spread_duration ? fmt(*r.risk.credit_spread_duration) : "-");
  ui->lblInflDur->setText(r.risk.inflation_duration ? fmt(*r.risk.inflation_duration) : "-");
  ui->lblParShift->setText(fmt(100.0 * r.par_shift) + " %");
  ui->lblDefaultProb->setText(std::isfinite(r.default_probability)
                              ? fmt(100.0 * r.default_probability) + " % / y" : "-");
  ui->lblBreakeven->setText(std::isfinite(r.breakeven) ? fmt(100.0 * r.breakeven) + " %" : "-");

  statusBar()->showMessage(tr("Analysis done in %1 ms").arg(ms), 3000);
}

void MainWindow::onWorkerFailed(const QString& why) {
  setBusy(false);
  qDebug() << "[UI] worker failed:" << why;
  statusBar()->showMessage(tr("Error: %1").arg(why), 5000);
  QMessageBox::warning(this, tr("BondWorkbench"), why);
}

// ===================== Scénarios =====================

void MainWindow::onRunScenario() {
  if (busy_) return;
  startWorker();

  bool ok = false;
  const std::vector<double> shocks = shocksFromUi(&ok);
  if (!ok) {
    QMessageBox::warning(this, tr("Scenarios"), tr("Shocks must be a comma-separated list of numbers."));
    return;
  }

  const bw::io::BondRow row = rowFromUi();
  const bw::config::EngineConfig cfg = engineConfigFromUi();
  const bw::market::ShockAxis axis = axisFromUi();

  qDebug() << "[UI] runScenario axis=" << ui->cbAxis->currentText() << "n=" << shocks.size();

  setBusy(true);
  statusBar()->showMessage(tr("Running scenarios…"));
  auto* w = worker_;
  QMetaObject::invokeMethod(w, [w, row, cfg, axis, shocks]{
    w->runScenario(row, cfg, axis, shocks);
  }, Qt::QueuedConnection);
}

void MainWindow::onScenarioFinished(const bw::scenario::ScenarioTable& table, long long ms) {
  setBusy(false);
  lastTable_ = table;

  const double unit = shockUnit(table.axis);
  const QString suffix = (table.axis == bw::market::ShockAxis::Spread) ? " bp" : " %";

  ui->tblScenario->setRowCount(static_cast<int>(table.rows.size()));
  for (int i = 0; i < static_cast<int>(table.rows.size()); ++i) {
    const auto& r = table.rows[static_cast<std::size_t>(i)];
    ui->tblScenario->setItem(i, 0, new QTableWidgetItem(fmt(r.shock * unit, 2) + suffix));
    ui->tblScenario->setItem(i, 1, new QTableWidgetItem(fmt(r.linear_approx_price)));
    ui->tblScenario->setItem(i, 2, new QTableWidgetItem(fmt(r.convexity_approx_price)));
    ui->tblScenario->setItem(i, 3, new QTableWidgetItem(fmt(r.exact_price)));
    ui->tblScenario->setItem(i, 4, new QTableWidgetItem(fmt(100.0 * r.percent_change, 3)));
  }
  fillScenarioChart(table);

  statusBar()->showMessage(tr("%1 scenarios (base %2, D %3, C %4) in %5 ms")
                           .arg(table.rows.size())
                           .arg(fmt(table.base_price))
                           .arg(fmt(table.sensitivity.duration))
                           .arg(fmt(table.sensitivity.convexity))
                           .arg(ms), 4000);
}

void MainWindow::setupScenarioChart() {
  if (scenChartView_) return;

  using namespace QtCharts;

  auto* chart = new QChart();
  chart->setTitle("Price vs shock");
  chart->legend()->setVisible(true);
  chart->legend()->setAlignment(Qt::AlignBottom);

  xAxis_ = new QValueAxis(chart);
  yAxis_ = new QValueAxis(chart);
  xAxis_->setTitleText("Shock");
  yAxis_->setTitleText("Price");
  xAxis_->setLabelFormat("%.2f");
  yAxis_->setLabelFormat("%.2f");
  chart->addAxis(xAxis_, Qt::AlignBottom);
  chart->addAxis(yAxis_, Qt::AlignLeft);

  linearSeries_ = new QLineSeries(chart); linearSeries_->setName("Linear");
  convexSeries_ = new QLineSeries(chart); convexSeries_->setName("Convexity");
  exactSeries_  = new QLineSeries(chart); exactSeries_->setName("Exact");

  linearSeries_->setPen(QPen(C_LINEAR, 1.6, Qt::DashLine));
  convexSeries_->setPen(QPen(C_CONVEX, 1.6, Qt::DashLine));
  exactSeries_->setPen(QPen(C_EXACT, 2.2));

  for (QLineSeries* s : { linearSeries_, convexSeries_, exactSeries_ }) {
    chart->addSeries(s);
    s->attachAxis(xAxis_);
    s->attachAxis(yAxis_);
  }

  scenChartView_ = new QChartView(chart, ui->chartContainer);
  scenChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(ui->chartContainer);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(scenChartView_);
}

void MainWindow::fillScenarioChart(const bw::scenario::ScenarioTable& table) {
  setupScenarioChart();
  linearSeries_->clear();
  convexSeries_->clear();
  exactSeries_->clear();
  if (table.rows.empty()) return;

  const double unit = shockUnit(table.axis);
  double xmin = std::numeric_limits<double>::infinity(), xmax = -xmin;
  double ymin = xmin, ymax = -xmin;
  for (const auto& r : table.rows) {
    const double x = r.shock * unit;
    linearSeries_->append(x, r.linear_approx_price);
    convexSeries_->append(x, r.convexity_approx_price);
    exactSeries_->append(x, r.exact_price);
    xmin = std::min(xmin, x); xmax = std::max(xmax, x);
    ymin = std::min({ ymin, r.linear_approx_price, r.convexity_approx_price, r.exact_price });
    ymax = std::max({ ymax, r.linear_approx_price, r.convexity_approx_price, r.exact_price });
  }
  if (xmax == xmin) { xmin -= 1.0; xmax += 1.0; }
  const double pad = std::max(1e-6, 0.05 * (ymax - ymin));
  xAxis_->setRange(xmin, xmax);
  yAxis_->setRange(ymin - pad, ymax + pad);
  xAxis_->setTitleText(table.axis == bw::market::ShockAxis::Spread ? "Shock (bp)" : "Shock (%)");
}

void MainWindow::onExportCsv() {
  if (!lastTable_) {
    statusBar()->showMessage(tr("Nothing to export: run scenarios first."), 2000);
    return;
  }
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export scenarios"), projectsDir() + "/scenarios.csv", tr("CSV (*.csv)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
    QMessageBox::warning(this, tr("Export scenarios"), f.errorString());
    return;
  }
  QTextStream out(&f);
  out << "axis,shock,linear_price,convexity_price,exact_price,percent_change\n";
  const char* axis = bw::market::to_string(lastTable_->axis);
  for (const auto& r : lastTable_->rows) {
    out << axis << ',' << QString::number(r.shock, 'g', 12)
        << ',' << QString::number(r.linear_approx_price, 'g', 12)
        << ',' << QString::number(r.convexity_approx_price, 'g', 12)
        << ',' << QString::number(r.exact_price, 'g', 12)
        << ',' << QString::number(r.percent_change, 'g', 12) << '\n';
  }
  f.close();
  statusBar()->showMessage(tr("Scenarios exported to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

// ===================== CSV d'obligations =====================

void MainWindow::onLoadCsv() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load bonds"), QFileInfo(projectsDir()).dir().absoluteFilePath("bonds"),
      tr("CSV (*.csv)"));
  if (fn.isEmpty()) return;

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  csvRows_ = bw::io::read_bond_csv(fn.toStdString(), &ignored, &warnings);
  for (const auto& w : warnings) qDebug() << "[csv]" << QString::fromStdString(w);

  {
    const QSignalBlocker block(ui->cbBond);
    ui->cbBond->clear();
    for (const auto& r : csvRows_) ui->cbBond->addItem(QString::fromStdString(r.name));
  }
  if (!csvRows_.empty()) onBondSelected(0);

  statusBar()->showMessage(tr("%1 bonds loaded, %2 ignored").arg(csvRows_.size()).arg(ignored), 3000);
}

void MainWindow::onBondSelected(int index) {
  if (index < 0 || index >= static_cast<int>(csvRows_.size())) return;
  applyRowToUi(csvRows_[static_cast<std::size_t>(index)]);
  clearResults();
}

// ===================== Projet JSON =====================

QJsonObject MainWindow::makeProjectJson() const {
  const bw::io::BondRow row = rowFromUi();

  QJsonObject bond;
  bond["name"]          = QString::fromStdString(row.name);
  bond["kind"]          = kindKey(row.kind);
  bond["coupon_pct"]    = row.coupon_pct;
  bond["face"]          = row.face;
  bond["freq"]          = row.freq;
  bond["maturity"]      = row.maturity;
  bond["short_first"]   = ui->chkShortFirst->isChecked();
  bond["quote"]         = ui->cbQuote->currentIndex() == 0 ? "price" : "yield";
  bond["price"]         = ui->dsbPrice->value();
  bond["yield_pct"]     = ui->dsbYield->value();
  bond["spread_bps"]    = row.spread_bps;
  bond["recovery"]      = row.recovery;
  bond["base_index"]    = row.base_index;
  bond["current_index"] = row.current_index;
  bond["lag_months"]    = row.lag_months;
  bond["inflation_pct"] = row.inflation_pct;
  bond["nominal_yield_pct"] = ui->dsbNominalYield->value();

  QJsonObject scen;
  scen["axis"]    = ui->cbAxis->currentText();
  scen["shocks"]  = ui->leShocks->text();
  scen["workers"] = ui->sbWorkers->value();

  QJsonObject o;
  o["version"]  = 1;
  o["saved_at"] = QDateTime::currentDateTime().toString(Qt::ISODate);
  o["bond"]     = bond;
  o["scenario"] = scen;
  return o;
}

void MainWindow::loadProjectJson(const QJsonObject& o) {
  const QJsonObject bond = o.value("bond").toObject();
  const QJsonObject scen = o.value("scenario").toObject();

  bw::io::BondRow row;
  row.name = bond.value("name").toString().toStdString();
  try {
    row.kind = bw::io::parse_bond_kind(bond.value("kind").toString("nominal").toStdString());
  } catch (const std::exception& e) {
    qDebug() << "[UI] project kind:" << e.what();
  }
  row.coupon_pct    = bond.value("coupon_pct").toDouble(row.coupon_pct);
  row.face          = bond.value("face").toDouble(row.face);
  row.freq          = bond.value("freq").toInt(row.freq);
  row.maturity      = bond.value("maturity").toDouble(row.maturity);
  row.stub          = bond.value("short_first").toBool(false) ? bw::market::FractionalPeriod::ShortFirst
                                                              : bw::market::FractionalPeriod::Reject;
  row.price         = bond.value("price").toDouble(NaN);
  row.yield_pct     = bond.value("yield_pct").toDouble(NaN);
  row.spread_bps    = bond.value("spread_bps").toDouble(row.spread_bps);
  row.recovery      = bond.value("recovery").toDouble(row.recovery);
  row.base_index    = bond.value("base_index").toDouble(row.base_index);
  row.current_index = bond.value("current_index").toDouble(row.current_index);
  row.lag_months    = bond.value("lag_months").toInt(row.lag_months);
  row.inflation_pct = bond.value("inflation_pct").toDouble(row.inflation_pct);
  applyRowToUi(row);

  ui->cbQuote->setCurrentIndex(bond.value("quote").toString("price") == "yield" ? 1 : 0);
  ui->dsbNominalYield->setValue(bond.value("nominal_yield_pct").toDouble(ui->dsbNominalYield->value()));
  ui->cbBond->setEditText(bond.value("name").toString());

  const int axisIdx = ui->cbAxis->findText(scen.value("axis").toString("rate"));
  ui->cbAxis->setCurrentIndex(axisIdx >= 0 ? axisIdx : 0);
  if (scen.contains("shocks")) ui->leShocks->setText(scen.value("shocks").toString());
  ui->sbWorkers->setValue(scen.value("workers").toInt(1));

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
  if (!f.open(QIODevice::WriteOnly)) {
    QMessageBox::warning(this, tr("Save project"), tr("Cannot open file for writing."));
    return;
  }
  QJsonDocument doc(makeProjectJson());
  f.write(doc.toJson(QJsonDocument::Indented));
  f.close();
  setCurrentProject(fn, /*dirty*/false);
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
  setCurrentProject(fn, /*dirty*/false);
  statusBar()->showMessage(tr("Project loaded from %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

QString MainWindow::projectsDir() const {
  QDir exeDir(QCoreApplication::applicationDirPath());

  // Candidats (selon où l'on lance le binaire)
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

QString MainWindow::projectDisplayName() const {
  if (currentProjectPath_.isEmpty()) return "No project";
  return QFileInfo(currentProjectPath_).fileName()
         + (projectDirty_ ? " *" : "");
}

void MainWindow::setCurrentProject(const QString& path, bool dirty) {
  currentProjectPath_ = path;
  projectDirty_ = dirty;
  if (projectLabel_) projectLabel_->setText(projectDisplayName());

  QString base = "BondWorkbench";
  if (!currentProjectPath_.isEmpty())
    base += " - " + projectDisplayName();
  setWindowTitle(base);
}

void MainWindow::markProjectDirty() {
  if (projectDirty_ || currentProjectPath_.isEmpty()) return;
  projectDirty_ = true;
  if (projectLabel_) projectLabel_->setText(projectDisplayName());
  setWindowTitle("BondWorkbench - " + projectDisplayName());
}
