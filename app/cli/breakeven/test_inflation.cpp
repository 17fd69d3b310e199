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
  // 1) Indexation
  {
    const InflationIndexation idx(250.0, 275.0);
    assert(idx.lag_months() == 3);
    assert(std::abs(idx.index_ratio() - 1.1) < 1e-15);
    assert(std::abs(idx.ratio_at(2.0, 0.02) - 1.1 * 1.0404) < 1e-12);
    assert(std::abs(idx.indexed_principal(100.0, 0.0, 0.05) - 110.0) < 1e-12);
    assert(throws<bw::DomainError>([&] { (void)idx.ratio_at(1.0, -1.0); }));
    assert(throws<bw::DomainError>([] { InflationIndexation(100.0, -5.0); }));
    assert(throws<bw::InvalidInputError>([] { InflationIndexation(100.0, 100.0, -1); }));
  }

  // 2) Prix d'un linker : ratio d'indice appliqué à tous les flux
  const BondTerms terms(0.00125, 100.0, 2, 49.0);
  const YieldSpec y = YieldSpec::inflation_linked(-0.0175, 0.041);
  {
    const Bond il  = Bond::inflation_linked(terms, InflationIndexation());
    const Bond il2 = Bond::inflation_linked(terms, InflationIndexation(100.0, 110.0));
    const double p  = bw::pricing::price(il, y);
    const double p2 = bw::pricing::price(il2, y);
    assert(std::abs(p - 1729.86946738729) < 1e-6);
    assert(std::abs(p2 / p - 1.1) < 1e-12);

    const auto flows = il.cash_flows(y);
    assert(std::abs(flows[flows.size() - 1].amount - 100.0625 * std::pow(1.041, 49.0)) < 1e-9);
    assert(throws<bw::DomainError>([&] { (void)bw::pricing::price(il, YieldSpec::inflation_linked(0.0, -1.2)); }));
  }

  // 3) Point mort : simple, Fisher, root-find
  const double nominal = 0.0445, real = -0.0175;
  assert(std::abs(breakeven_simple(nominal, real) - 0.062) < 1e-15);
  assert(std::abs(fisher_breakeven(nominal, real) - 0.06310432569974544) < 1e-14);
  assert(std::abs(fisher_nominal_yield(real, fisher_breakeven(nominal, real)) - nominal) < 1e-14);
  assert(throws<bw::DomainError>([] { (void)fisher_breakeven(0.04, -1.0); }));
  {
    const Bond il = Bond::inflation_linked(terms, InflationIndexation());
    const auto be = breakeven_inflation(il, nominal, real);
    // profil uniforme semestriel : forme fermée composée
    const double closed = std::pow((1.0 + nominal / 2.0) / (1.0 + real / 2.0), 2.0) - 1.0;
    assert(std::abs(be.inflation - closed) < 1e-10);
    assert(std::abs(be.inflation - 0.06352532961012936) < 1e-10);
    assert(std::abs(be.inflation - breakeven_simple(nominal, real)) < 2e-3);
    std::cout << "breakeven=" << be.inflation << " iters=" << be.iterations << "\n";

    // autre profil de flux (annuel, court) : la forme fermée change avec f
    const Bond il1 = Bond::inflation_linked(BondTerms(0.02, 100.0, 1, 10.0), InflationIndexation());
    const auto be1 = breakeven_inflation(il1, nominal, real);
    assert(std::abs(be1.inflation - ((1.0 + nominal) / (1.0 + real) - 1.0)) < 1e-10);
  }

  std::cout << "Inflation OK.\n";
  return 0;
}
