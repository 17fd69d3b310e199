#include "bw/pricing/pricing_engine.hpp"
#include "bw/market/bond.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using bw::market::Bond;
using bw::market::BondTerms;
using bw::market::YieldSpec;

template <class E, class F>
static bool throws(F&& fn) {
  try { fn(); } catch (const E&) { return true; }
  return false;
}

int main() {
  // 1) Zéro-coupon : F / (1 + y/f)^(T f)
  {
    const Bond zc = Bond::nominal(BondTerms(0.0, 100.0, 2, 10.0));
    const double p = bw::pricing::price(zc, YieldSpec::nominal(0.05));
    assert(std::abs(p - 100.0 / std::pow(1.025, 20.0)) < 1e-10);
    assert(std::abs(p - 61.027094285883074) < 1e-9);
  }

  // 2) Coupon = rendement ⇒ pair
  {
    const Bond b = Bond::nominal(BondTerms(0.06, 100.0, 2, 30.0));
    assert(std::abs(bw::pricing::price(b, YieldSpec::nominal(0.06)) - 100.0) < 1e-9);
  }

  // 3) Monotonie stricte en y (de -50 % à +50 %)
  const Bond ust = Bond::nominal(BondTerms(0.0125, 100.0, 2, 26.0), "UST");
  {
    double prev = bw::pricing::price(ust, YieldSpec::nominal(-0.5));
    for (int k = -49; k <= 50; ++k) {
      const double p = bw::pricing::price(ust, YieldSpec::nominal(0.01 * k));
      assert(p < prev);
      prev = p;
    }
  }

  // 4) Dérivées analytiques cohérentes avec le prix
  {
    const double y = 0.0454519052205286;
    const auto d = bw::pricing::yield_derivatives(ust.schedule(), y);
    assert(std::abs(d.pv - 50.036) < 1e-9);
    const double h = 1e-6;
    const double pu = bw::pricing::present_value(ust.schedule(), y + h);
    const double pd = bw::pricing::present_value(ust.schedule(), y - h);
    assert(std::abs((pu - pd) / (2 * h) - d.dpv) < 1e-5 * std::abs(d.dpv));
    assert(d.d2pv > 0.0);
  }

  // 5) Base 1 + y/f <= 0 ⇒ DomainError
  assert(throws<bw::DomainError>([&] { (void)bw::pricing::price(ust, YieldSpec::nominal(-2.0)); }));
  assert(throws<bw::DomainError>([&] { (void)bw::pricing::price(ust, YieldSpec::nominal(-2.5)); }));
  assert(throws<bw::DomainError>([] { (void)bw::pricing::discount_factor(-1.5, 1, 1.0); }));
  assert(std::abs(bw::pricing::discount_factor(0.0, 2, 7.0) - 1.0) < 1e-15);

  // 6) Corporate : actualisé à base + spread
  {
    const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 36.0));
    const Bond nom  = Bond::nominal(BondTerms(0.0225, 100.0, 2, 36.0));
    const double pc = bw::pricing::price(corp, YieldSpec::corporate(0.0479, 0.0085));
    const double pn = bw::pricing::price(nom, YieldSpec::nominal(0.0564));
    assert(std::abs(pc - pn) < 1e-10);
    assert(std::abs(pc - 48.00945611407909) < 1e-8);
  }

  // 7) Pureté : mêmes entrées, même sortie
  assert(bw::pricing::price(ust, YieldSpec::nominal(0.047)) ==
         bw::pricing::price(ust, YieldSpec::nominal(0.047)));

  std::cout << "Pricing OK.\n";
  return 0;
}
