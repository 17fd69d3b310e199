#pragma once
#include <QObject>
#include <QString>
#include <atomic>
#include <limits>
#include <vector>

// BW types (on passe par valeur ⇒ on inclut ici)
#include <bw/config/engine_config.hpp>
#include <bw/io/bond_csv.hpp>
#include <bw/market/yield_spec.hpp>
#include <bw/risk/sensitivity.hpp>
#include <bw/scenario/scenario_engine.hpp>

namespace gui {

// Résultat d'analyse d'une obligation, prêt à afficher.
struct BondAnalysis {
  QString name;
  QString kind;
  bw::market::YieldSpec spec;
  bw::risk::SensitivityResult risk{};
  double par_shift           = std::numeric_limits<double>::quiet_NaN();
  double default_probability = std::numeric_limits<double>::quiet_NaN();
  double breakeven           = std::numeric_limits<double>::quiet_NaN();
};

class BondWorker : public QObject {
  Q_OBJECT
public:
  explicit BondWorker(QObject* parent = nullptr);
  ~BondWorker() override = default;

public slots:
  // Pricing + sensibilités. nominalYield (décimal) ne sert qu'au breakeven d'un linker.
  void analyze(bw::io::BondRow row,
               bw::config::EngineConfig cfg,
               double nominalYield);

  // Table de chocs sur un axe ; chocs en décimal.
  void runScenario(bw::io::BondRow row,
                   bw::config::EngineConfig cfg,
                   bw::market::ShockAxis axis,
                   std::vector<double> shocks);

  // Demande d’arrêt asynchrone (ignore le résultat en cours)
  void requestStop();

signals:
  void analyzed(gui::BondAnalysis result, long long elapsed_ms);
  void scenarioFinished(bw::scenario::ScenarioTable table, long long elapsed_ms);
  void failed(QString why);

private:
  std::atomic<bool> stop_{false};
};

} // namespace gui
