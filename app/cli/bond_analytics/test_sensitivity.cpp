#include "bw/risk/sensitivity.hpp"
#include "bw/pricing/ytm_solver.hpp"
#include "bw/pricing/pricing_engine.hpp"
#include "bw/market/bond.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using bw::market::Bond;
using bw::market::BondTerms;
using bw::market::ShockAxis;
using bw::market::YieldSpec;
using bw::config::SensitivityConfig;
using bw::config::SensitivityMethod;

static double rel(double a, double b) { return std::abs(a - b) / std::abs(b); }

int main() {
  const Bond ust = Bond::nominal(BondTerms(0.0125, 100.0, 2, 26.0), "UST 1.25%");
  const YieldSpec y = YieldSpec::nominal(bw::pricing::solve_yield(ust, 50.036).yield);

  // 1) Valeurs de référence (analytique)
  const auto s = bw::risk::sensitivities(ust, y);
  assert(std::abs(s.price - 50.036) < 1e-9);
  assert(std::abs(s.modified_duration - 19.783234530925238) < 1e-8);
  assert(std::abs(s.convexity - 472.26889029678443) < 1e-6);
  assert(std::abs(s.macaulay_duration - 20.23282738135279) < 1e-8);
  assert(std::abs(s.dv01 - s.modified_duration * s.price * 1e-4) < 1e-12);
  assert(!s.credit_spread_duration && !s.inflation_duration);
  std::cout << "MD=" << s.modified_duration << " C=" << s.convexity << "\n";

  // 2) Différences finies cohérentes avec l'analytique pour eps dans [1e-5, 1e-3]
  for (double eps : { 1e-3, 1e-4, 1e-5 }) {
    SensitivityConfig fd;
    fd.method = SensitivityMethod::FiniteDifference;
    fd.bump = eps;
    const auto f = bw::risk::sensitivities(ust, y, fd);
    assert(rel(f.modified_duration, s.modified_duration) < 1e-3);
    assert(rel(f.convexity, s.convexity) < 1e-3);
  }

  // 3) Zéro-coupon : Macaulay = maturité
  {
    const Bond zc = Bond::nominal(BondTerms(0.0, 100.0, 2, 10.0));
    const auto z = bw::risk::sensitivities(zc, YieldSpec::nominal(0.05));
    assert(std::abs(z.macaulay_duration - 10.0) < 1e-12);
    assert(std::abs(z.modified_duration - 10.0 / 1.025) < 1e-12);
  }

  // 4) Corporate : duration de spread = duration au taux (pente 1 dans l'actualisation)
  {
    const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 36.0));
    const auto c = bw::risk::sensitivities(corp, YieldSpec::corporate(0.0479, 0.0085));
    assert(c.credit_spread_duration);
    assert(!c.inflation_duration);
    assert(std::abs(c.price - 48.00945611407909) < 1e-8);
    assert(std::abs(c.modified_duration - 18.66263985105105) < 1e-7);
    assert(std::abs(c.convexity - 522.7157463998051) < 1e-5);
    assert(rel(*c.credit_spread_duration, c.modified_duration) < 1e-5);
  }

  // 5) Linker : duration d'inflation négative (le prix croît avec l'inflation)
  {
    const Bond il = Bond::inflation_linked(BondTerms(0.00125, 100.0, 2, 49.0),
                                           bw::variants::InflationIndexation());
    const auto l = bw::risk::sensitivities(il, YieldSpec::inflation_linked(-0.0175, 0.041));
    assert(l.inflation_duration);
    assert(!l.credit_spread_duration);
    assert(*l.inflation_duration < 0.0);
    assert(l.modified_duration > 0.0);
  }

  // 6) Axe non porté, bump invalide
  {
    bool caught = false;
    try { (void)bw::risk::axis_sensitivity(ust, y, ShockAxis::Spread); }
    catch (const bw::InvalidInputError&) { caught = true; }
    assert(caught);

    SensitivityConfig bad;
    bad.method = SensitivityMethod::FiniteDifference;
    bad.bump = 0.0;
    caught = false;
    try { (void)bw::risk::sensitivities(ust, y, bad); }
    catch (const bw::InvalidInputError&) { caught = true; }
    assert(caught);
  }

  std::cout << "Sensitivity OK.\n";
  return 0;
}
