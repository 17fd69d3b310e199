#include "bw/core/stats.hpp"
#include "bw/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

int main() {
  // 1) Welford : moyenne / variance d'échantillon
  {
    bw::core::RunningStats st;
    assert(std::isnan(st.variance()));
    for (double x : { 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0 }) st.add(x);
    assert(st.count() == 8);
    assert(std::abs(st.mean() - 5.0) < 1e-15);
    assert(std::abs(st.variance() - 32.0 / 7.0) < 1e-12);
    assert(std::abs(st.stddev() - std::sqrt(32.0 / 7.0)) < 1e-12);
  }

  // 2) Volatilité glissante (fenêtre 3, annualisée sur 252)
  {
    const std::vector<double> px { 100, 101, 99, 102, 103, 101 };
    const auto v = bw::core::rolling_volatility(px, 3, 252.0);
    assert(v.size() == px.size());
    assert(std::isnan(v[0]) && std::isnan(v[1]) && std::isnan(v[2]));
    assert(std::abs(v[3] - 0.4000713585122152) < 1e-12);
    assert(std::abs(v[4] - 0.39987981711575077) < 1e-12);
    assert(std::abs(v[5] - 0.39666327537710777) < 1e-12);
  }

  // 3) Croissance constante : volatilité nulle
  {
    std::vector<double> px;
    double p = 50.0;
    for (int i = 0; i < 40; ++i) { px.push_back(p); p *= 1.001; }
    const auto v = bw::core::rolling_volatility(px, 10);
    assert(std::abs(v.back()) < 1e-12);
  }

  // 4) Série trop courte, entrées invalides
  assert(std::isnan(bw::core::rolling_volatility({ 1.0, 2.0 }, 5).back()));
  bool caught = false;
  try { (void)bw::core::rolling_volatility({ 1.0, -2.0, 3.0 }, 2); }
  catch (const bw::InvalidInputError&) { caught = true; }
  assert(caught);

  std::cout << "Stats OK.\n";
  return 0;
}
