#pragma once
#include <QMainWindow>
#include <QThread>
#include <QJsonObject>
#include <QLabel>
#include <optional>
#include <vector>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <bw/config/engine_config.hpp>
#include <bw/io/bond_csv.hpp>
#include <bw/scenario/scenario_engine.hpp>

#include "BondWorker.hpp"

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onAnalyze();
  void onRunScenario();
  void onExportCsv();
  void onLoadCsv();
  void onBondSelected(int index);
  void onKindChanged(int index);
  void onReset();

  // Callbacks worker
  void onAnalyzed(const gui::BondAnalysis& r, long long ms);
  void onScenarioFinished(const bw::scenario::ScenarioTable& table, long long ms);
  void onWorkerFailed(const QString& why);

  void onSaveProject();
  void onLoadProject();

private:
  Ui::MainWindow* ui = nullptr;

  // Worker (thread dédié)
  QThread*         workerThread_ = nullptr;
  gui::BondWorker* worker_       = nullptr;
  bool             busy_         = false;
  void startWorker();
  void stopWorker();
  void setBusy(bool on);

  // Obligations chargées depuis un CSV
  std::vector<bw::io::BondRow> csvRows_;

  // Saisie <-> ligne d'obligation
  bw::io::BondRow rowFromUi() const;
  void applyRowToUi(const bw::io::BondRow& row);
  bw::config::EngineConfig engineConfigFromUi() const;
  bw::market::ShockAxis axisFromUi() const;
  std::vector<double> shocksFromUi(bool* ok) const;

  void clearResults();

  // Chart scénarios
  QtCharts::QChartView*  scenChartView_ = nullptr;
  QtCharts::QLineSeries* linearSeries_  = nullptr;
  QtCharts::QLineSeries* convexSeries_  = nullptr;
  QtCharts::QLineSeries* exactSeries_   = nullptr;
  QtCharts::QValueAxis*  xAxis_         = nullptr;
  QtCharts::QValueAxis*  yAxis_         = nullptr;
  void setupScenarioChart();
  void fillScenarioChart(const bw::scenario::ScenarioTable& table);

  std::optional<bw::scenario::ScenarioTable> lastTable_;

  // Projet JSON
  QLabel* projectLabel_ = nullptr;
  QString currentProjectPath_;
  bool    projectDirty_ = false;
  QJsonObject makeProjectJson() const;
  void loadProjectJson(const QJsonObject& o);
  QString projectsDir() const;
  QString projectDisplayName() const;
  void setCurrentProject(const QString& path, bool dirty);
  void markProjectDirty();

  void wireSignals();
};
