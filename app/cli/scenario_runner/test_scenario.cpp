#include "bw/scenario/scenario_engine.hpp"
#include "bw/pricing/pricing_engine.hpp"
#include "bw/market/bond.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using bw::market::Bond;
using bw::market::BondTerms;
using bw::market::ShockAxis;
using bw::market::YieldSpec;

template <class E, class F>
static bool throws(F&& fn) {
  try { fn(); } catch (const E&) { return true; }
  return false;
}

int main() {
  const Bond ust = Bond::nominal(BondTerms(0.0125, 100.0, 2, 26.0), "UST 1.25%");
  const YieldSpec y = YieldSpec::nominal(0.0454519052205286);

  // 1) Table de chocs : ordre conservé, reprice exact, convexité >= linéaire
  const std::vector<double> shocks { 0.03, -0.04, 0.01, -0.03, 0.04, -0.01, 0.0 };
  const auto t = bw::scenario::run_scenario(ust, y, shocks);
  assert(t.rows.size() == shocks.size());
  assert(std::abs(t.base_price - 50.036) < 1e-9);
  assert(std::abs(t.sensitivity.duration - 19.783234530925238) < 1e-8);
  for (std::size_t i = 0; i < shocks.size(); ++i) {
    const auto& r = t.rows[i];
    assert(r.shock == shocks[i]);
    assert(std::abs(r.exact_price - bw::pricing::price(ust, YieldSpec::nominal(y.rate + shocks[i]))) < 1e-12);
    if (std::abs(r.shock) >= 0.01) {
      assert(std::abs(r.convexity_approx_price - r.exact_price) <=
             std::abs(r.linear_approx_price - r.exact_price));
    }
  }
  // choc -3 % : +87.26 %
  assert(std::abs(t.rows[3].percent_change - 0.8726360920832995) < 1e-9);
  assert(std::abs(t.rows[1].exact_price - 117.06387742151611) < 1e-8);
  assert(t.rows[6].percent_change == 0.0);
  assert(t.rows[6].linear_approx_price == t.base_price);

  // 2) Parallélisme : mêmes lignes, même ordre
  {
    bw::config::ScenarioConfig cfg;
    cfg.workers = 3;
    const auto tp = bw::scenario::run_scenario(ust, y, shocks, ShockAxis::Rate, cfg);
    assert(tp.rows.size() == t.rows.size());
    for (std::size_t i = 0; i < t.rows.size(); ++i) {
      assert(tp.rows[i].shock == t.rows[i].shock);
      assert(tp.rows[i].exact_price == t.rows[i].exact_price);
    }
  }

  // 3) Cas limites
  assert(bw::scenario::run_scenario(ust, y, {}).rows.empty());
  assert(throws<bw::InvalidInputError>([&] {
    (void)bw::scenario::run_scenario(ust, y, { 0.01, std::numeric_limits<double>::quiet_NaN() });
  }));
  assert(throws<bw::InvalidInputError>([&] {
    (void)bw::scenario::run_scenario(ust, y, { 0.01 }, ShockAxis::Spread);
  }));
  // base 1 + y/f <= 0 ⇒ DomainError, y compris depuis un worker
  assert(throws<bw::DomainError>([&] {
    (void)bw::scenario::run_scenario(ust, y, { -0.01, -2.1 });
  }));
  {
    bw::config::ScenarioConfig cfg;
    cfg.workers = 2;
    assert(throws<bw::DomainError>([&] {
      (void)bw::scenario::run_scenario(ust, y, { -0.01, 0.01, -2.1, 0.02 }, ShockAxis::Rate, cfg);
    }));
  }

  // 4) Axe inflation (linker) : le prix monte avec l'inflation
  {
    const Bond il = Bond::inflation_linked(BondTerms(0.00125, 100.0, 2, 49.0),
                                           bw::variants::InflationIndexation());
    const auto ti = bw::scenario::run_scenario(il, YieldSpec::inflation_linked(-0.0175, 0.041),
                                               { -0.01, 0.01 }, ShockAxis::Inflation);
    assert(ti.rows[0].percent_change < 0.0);
    assert(ti.rows[1].percent_change > 0.0);
    assert(ti.sensitivity.duration < 0.0);
  }

  // 5) Grille taux × spread (corporate), ordre taux d'abord
  {
    const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 36.0));
    const YieldSpec yc = YieldSpec::corporate(0.0479, 0.0085);
    const auto g = bw::scenario::run_rate_spread_grid(corp, yc, { -0.01, 0.0, 0.01 }, { -0.005, 0.0 });
    assert(g.size() == 6);
    assert(g[0].rate_shock == -0.01 && g[0].spread_shock == -0.005);
    assert(g[1].rate_shock == -0.01 && g[1].spread_shock == 0.0);
    assert(g[2].rate_shock == 0.0 && g[2].spread_shock == -0.005);
    assert(std::abs(g[0].percent_change - 0.3495289507782473) < 1e-9);
    assert(std::abs(g[0].additive_percent_change - 0.3160261715911057) < 1e-9);
    assert(g[0].percent_change > g[0].additive_percent_change);
    assert(g[3].percent_change == 0.0 && g[3].additive_percent_change == 0.0);

    assert(throws<bw::InvalidInputError>([&] {
      (void)bw::scenario::run_rate_spread_grid(ust, y, { 0.01 }, { 0.001 });
    }));
  }

  // 6) Grille : choc joint valide mais choc de taux seul hors domaine
  {
    const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 10.0));
    const YieldSpec yc = YieldSpec::corporate(0.04, 0.01);
    const auto g = bw::scenario::run_rate_spread_grid(corp, yc, { -2.1 }, { 0.3 });
    assert(g.size() == 1);
    // base jointe 1 + (-1.75)/2 = 0.125 > 0 ; taux seul : 1 + (-2.05)/2 < 0
    const double joint = bw::pricing::price(corp, yc.shifted(ShockAxis::Rate, -2.1).shifted(ShockAxis::Spread, 0.3));
    assert(std::abs(g[0].exact_price - joint) <= 1e-9 * joint);
    assert(std::isfinite(g[0].percent_change) && g[0].percent_change > 0.0);
    assert(std::isnan(g[0].additive_percent_change));

    // choc joint lui-même hors domaine : toujours une erreur
    assert(throws<bw::DomainError>([&] {
      (void)bw::scenario::run_rate_spread_grid(corp, yc, { -2.1 }, { -0.1 });
    }));
  }

  std::cout << "Scenario OK.\n";
  return 0;
}
