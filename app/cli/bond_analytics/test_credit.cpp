#include "bw/variants/credit.hpp"
#include "bw/variants/inflation.hpp"
#include "bw/market/bond.hpp"
#include "bw/pricing/pricing_engine.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using bw::market::Bond;
using bw::market::BondTerms;
using bw::market::YieldSpec;
using namespace bw::variants;

template <class E, class F>
static bool throws(F&& fn) {
  try { fn(); } catch (const E&) { return true; }
  return false;
}

int main() {
  // 1) Conversions et probabilité de défaut
  assert(std::abs(bps_to_fraction(85.0) - 0.0085) < 1e-15);
  assert(std::abs(fraction_to_bps(0.0085) - 85.0) < 1e-9);
  assert(std::abs(default_probability(0.0085, 0.4) - 0.0085 / 0.6) < 1e-15);
  assert(default_probability(0.0, 0.4) == 0.0);
  assert(throws<bw::InvalidInputError>([] { (void)default_probability(0.0085, 1.0); }));
  assert(throws<bw::InvalidInputError>([] { (void)default_probability(0.0085, -0.1); }));
  assert(throws<bw::InvalidInputError>([] { (void)default_probability(-0.001, 0.4); }));
  assert(throws<bw::InvalidInputError>([] { CreditSpreadOverlay(1.0); }));

  // 2) Courbe linéaire par morceaux, extrapolation plate
  const TreasuryCurve curve({ {1, 0.0450}, {2, 0.0455}, {5, 0.0460}, {10, 0.0465},
                              {20, 0.0470}, {30, 0.0479} });
  assert(std::abs(curve.rate_at(0.5) - 0.0450) < 1e-15);
  assert(std::abs(curve.rate_at(1.5) - 0.04525) < 1e-12);
  assert(std::abs(curve.rate_at(25.0) - 0.04745) < 1e-12);
  assert(std::abs(curve.rate_at(36.0) - 0.0479) < 1e-15);
  assert(throws<bw::InvalidInputError>([] { TreasuryCurve({}); }));
  assert(throws<bw::InvalidInputError>([] { TreasuryCurve({ {2, 0.04}, {1, 0.04} }); }));

  // 3) Z-spread : sur une courbe plate, égal au spread de pricing
  const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 36.0), CreditSpreadOverlay(0.4),
                                    "Alphabet 2.25%");
  {
    const double p = bw::pricing::price(corp, YieldSpec::corporate(0.0479, 0.0085));
    const auto z = z_spread(corp, p, TreasuryCurve({ {1, 0.0479} }));
    assert(std::abs(z.spread - 0.0085) < 1e-9);
  }

  // 4) Z-spread sur la courbe pentue : reprice exactement
  {
    const double p = bw::pricing::price(corp, YieldSpec::corporate(0.0479, 0.0085));
    const auto z = z_spread(corp, p, curve);
    double pv = 0.0;
    for (const auto& cf : corp.schedule()) {
      pv += cf.amount * std::pow(1.0 + (curve.rate_at(cf.time) + z.spread) / 2.0, -2.0 * cf.time);
    }
    assert(std::abs(pv - p) < 1e-8);
    // courbe sous 4.79 % partout ⇒ spread plus large que 85 bp
    assert(z.spread > 0.0085);
    std::cout << "Z-spread=" << fraction_to_bps(z.spread) << "bp\n";
  }

  assert(throws<bw::InvalidInputError>([&] { (void)z_spread(corp, 0.0, curve); }));

  // 5) Choc joint vs séparé : la somme des variations sous-estime le choc joint à la baisse
  {
    const YieldSpec y = YieldSpec::corporate(0.0479, 0.0085);
    const double p0 = bw::pricing::price(corp, y);
    const double joint = bw::pricing::price(corp, YieldSpec::corporate(0.0379, 0.0035)) / p0 - 1.0;
    assert(std::abs(joint - 0.3495289507782473) < 1e-9);
  }

  // Recouvrement : capacité de la variante, sans test de type
  {
    const Bond corp = Bond::corporate(BondTerms(0.0225, 100.0, 2, 36.0), CreditSpreadOverlay(0.35));
    const Bond ust  = Bond::nominal(BondTerms(0.0125, 100.0, 2, 26.0));
    const Bond il   = Bond::inflation_linked(BondTerms(0.00125, 100.0, 2, 49.0), InflationIndexation());
    assert(corp.recovery_rate() && *corp.recovery_rate() == 0.35);
    assert(!ust.recovery_rate());
    assert(!il.recovery_rate());
    assert(corp.carries(bw::market::ShockAxis::Spread) && !corp.carries(bw::market::ShockAxis::Inflation));
    assert(il.carries(bw::market::ShockAxis::Inflation) && !il.carries(bw::market::ShockAxis::Spread));
  }

  std::cout << "Credit OK.\n";
  return 0;
}
