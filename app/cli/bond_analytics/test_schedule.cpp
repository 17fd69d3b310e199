#include "bw/cashflows/schedule.hpp"
#include "bw/market/bond_terms.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using bw::market::BondTerms;
using bw::market::FractionalPeriod;

template <class E, class F>
static bool throws(F&& fn) {
  try { fn(); } catch (const E&) { return true; }
  return false;
}

int main() {
  constexpr double EPS = 1e-12;

  // 1) Cas régulier : t = k/f, coupon c F / f, nominal sur le dernier flux
  {
    const auto s = bw::cashflows::build_schedule(BondTerms(0.05, 100.0, 2, 1.0));
    assert(s.size() == 2);
    assert(s.payments_per_year() == 2);
    assert(std::abs(s[0].time - 0.5) < EPS && std::abs(s[0].amount - 2.5) < EPS);
    assert(std::abs(s[1].time - 1.0) < EPS && std::abs(s[1].amount - 102.5) < EPS);
    assert(std::abs(s.maturity() - 1.0) < EPS);
    assert(std::abs(s.total_amount() - 105.0) < EPS);
  }

  // 2) Treasury 26 ans semestriel : 52 flux
  {
    const auto s = bw::cashflows::build_schedule(BondTerms(0.0125, 100.0, 2, 26.0));
    assert(s.size() == 52);
    assert(std::abs(s[51].amount - 100.625) < EPS);
    double prev = 0.0;
    for (const auto& cf : s) { assert(cf.time > prev); prev = cf.time; }
  }

  // 3) Zéro-coupon : un seul montant non nul, le nominal
  {
    const auto s = bw::cashflows::build_schedule(BondTerms(0.0, 100.0, 2, 10.0));
    assert(s.size() == 20);
    for (std::size_t i = 0; i + 1 < s.size(); ++i) assert(s[i].amount == 0.0);
    assert(std::abs(s[19].amount - 100.0) < EPS);
  }

  // 4) Période fractionnaire : rejet par défaut, première période courte sinon
  {
    assert(throws<bw::InvalidInputError>([] {
      (void)bw::cashflows::build_schedule(BondTerms(0.02, 100.0, 2, 10.3));
    }));

    const auto s = bw::cashflows::build_schedule(
        BondTerms(0.0125, 100.0, 2, 26.2, FractionalPeriod::ShortFirst));
    assert(s.size() == 53);
    assert(std::abs(s[0].time - 0.2) < 1e-9);
    assert(std::abs(s[0].amount - 0.625) < EPS);
    assert(std::abs(s[52].time - 26.2) < 1e-9);
    assert(std::abs(s[52].amount - 100.625) < EPS);

    const auto tiny = bw::cashflows::build_schedule(
        BondTerms(0.04, 100.0, 2, 0.3, FractionalPeriod::ShortFirst));
    assert(tiny.size() == 1);
    assert(std::abs(tiny[0].time - 0.3) < 1e-9);
    assert(std::abs(tiny[0].amount - 102.0) < EPS);
  }

  // 5) Termes invalides
  assert(throws<bw::InvalidInputError>([] { BondTerms(0.02, 0.0, 2, 10.0); }));
  assert(throws<bw::InvalidInputError>([] { BondTerms(-0.01, 100.0, 2, 10.0); }));
  assert(throws<bw::InvalidInputError>([] { BondTerms(0.02, 100.0, 0, 10.0); }));
  assert(throws<bw::InvalidInputError>([] { BondTerms(0.02, 100.0, 2, -1.0); }));
  assert(throws<bw::InvalidInputError>([] { BondTerms(0.02, 100.0, 2, std::nan("")); }));

  // 6) Échéancier construit à la main : temps strictement croissants
  assert(throws<bw::InvalidInputError>([] {
    bw::cashflows::CashFlowSchedule({{1.0, 1.0}, {1.0, 101.0}}, 1);
  }));
  assert(throws<bw::InvalidInputError>([] {
    bw::cashflows::CashFlowSchedule({{0.0, 101.0}}, 1);
  }));
  assert(throws<bw::InvalidInputError>([] {
    bw::cashflows::CashFlowSchedule({}, 2);
  }));

  std::cout << "Schedule OK.\n";
  return 0;
}
