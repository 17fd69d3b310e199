#include "BondWorker.hpp"

#include <bw/market/bond.hpp>
#include <bw/pricing/ytm_solver.hpp>
#include <bw/variants/credit.hpp>
#include <bw/variants/inflation.hpp>
#include <bw/core/errors.hpp>

#include <chrono>
#include <cmath>

#include <QDebug>
#include <QMetaType>

namespace {
inline long long elapsed_ms(std::chrono::steady_clock::time_point t0) {
  const auto t1 = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
}
} // namespace

namespace gui {

BondWorker::BondWorker(QObject* parent) : QObject(parent) {
  qRegisterMetaType<gui::BondAnalysis>("gui::BondAnalysis");
  qRegisterMetaType<bw::scenario::ScenarioTable>("bw::scenario::ScenarioTable");
}

void BondWorker::requestStop() { stop_.store(true, std::memory_order_relaxed); }

void BondWorker::analyze(bw::io::BondRow row,
                         bw::config::EngineConfig cfg,
                         double nominalYield)
{
  stop_.store(false, std::memory_order_relaxed);

  try {
    const auto t0 = std::chrono::steady_clock::now();

    const bw::market::Bond bond = bw::io::make_bond(row);
    const bw::market::YieldSpec y = bw::io::resolve_yield_spec(bond, row, cfg.solver);

    qDebug() << "[analyze]" << QString::fromStdString(row.name)
             << "kind=" << bw::market::to_string(bond.kind())
             << "flows=" << bond.schedule().size()
             << "rate=" << y.rate << "spread=" << y.credit_spread << "infl=" << y.inflation;

    BondAnalysis out;
    out.name = QString::fromStdString(row.name);
    out.kind = QString::fromUtf8(bw::market::to_string(bond.kind()));
    out.spec = y;
    out.risk = bw::risk::sensitivities(bond, y, cfg.sensitivity);
    out.par_shift = bw::pricing::yield_shift_to_price(bond, y, bond.terms().face_value, cfg.solver);

    if (const auto recovery = bond.recovery_rate()) {
      if (y.credit_spread >= 0.0)
        out.default_probability = bw::variants::default_probability(y.credit_spread, *recovery);
    }
    if (bond.carries(bw::market::ShockAxis::Inflation) && std::isfinite(nominalYield)) {
      out.breakeven = bw::variants::breakeven_inflation(bond, nominalYield, y.rate, cfg.solver).inflation;
    }

    if (stop_.load(std::memory_order_relaxed)) return;
    emit analyzed(out, elapsed_ms(t0));
  } catch (const bw::ConvergenceError& e) {
    emit failed(QString("%1 (iterations %2)").arg(QString::fromUtf8(e.what())).arg(e.iterations()));
  } catch (const std::exception& e) {
    emit failed(QString::fromUtf8(e.what()));
  }
}

void BondWorker::runScenario(bw::io::BondRow row,
                             bw::config::EngineConfig cfg,
                             bw::market::ShockAxis axis,
                             std::vector<double> shocks)
{
  stop_.store(false, std::memory_order_relaxed);

  try {
    const auto t0 = std::chrono::steady_clock::now();

    const bw::market::Bond bond = bw::io::make_bond(row);
    const bw::market::YieldSpec y = bw::io::resolve_yield_spec(bond, row, cfg.solver);

    qDebug() << "[runScenario]" << QString::fromStdString(row.name)
             << "axis=" << bw::market::to_string(axis)
             << "shocks=" << shocks.size()
             << "workers=" << cfg.scenario.workers;

    bw::scenario::ScenarioTable table = bw::scenario::run_scenario(bond, y, shocks, axis, cfg.scenario);

    if (stop_.load(std::memory_order_relaxed)) return;
    emit scenarioFinished(table, elapsed_ms(t0));
  } catch (const bw::ConvergenceError& e) {
    emit failed(QString("%1 (iterations %2)").arg(QString::fromUtf8(e.what())).arg(e.iterations()));
  } catch (const std::exception& e) {
    emit failed(QString::fromUtf8(e.what()));
  }
}

} // namespace gui
