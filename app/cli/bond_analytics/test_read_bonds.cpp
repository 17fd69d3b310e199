#include "bw/io/bond_csv.hpp"
#include "bw/io/series_csv.hpp"
#include "bw/pricing/pricing_engine.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm> // any_of
using namespace std;

int main(int argc, char** argv) {
  const string dir  = (argc>1 ? argv[1] : "data");
  const string path = dir + "/bonds/test_bonds.csv";

  size_t ignored = 0;
  vector<string> warnings;
  auto rows = bw::io::read_bond_csv(path, &ignored, &warnings);

  cout << "Valid rows: " << rows.size() << "\n";
  cout << "Ignored rows: " << ignored << "\n";

  constexpr double EPS = 1e-12;
  assert(rows.size() == 3);
  assert(ignored == 5);
  assert(rows[0].name == "ZC 10Y");
  assert(rows[1].kind == bw::market::BondKind::Corporate);
  assert(rows[2].kind == bw::market::BondKind::InflationLinked);
  assert(std::abs(rows[1].spread_bps - 120.0) < EPS);
  assert(std::abs(rows[1].recovery - 0.35) < EPS);
  assert(rows[2].lag_months == 3);

  auto has_warn = [&](const string& needle){
    return any_of(warnings.begin(), warnings.end(),
                  [&](const string& w){ return w.find(needle) != string::npos; });
  };
  assert(has_warn("face_value"));
  assert(has_warn("not a positive integer"));
  assert(has_warn("ni prix ni rendement"));
  assert(has_warn("recovery_rate"));
  assert(has_warn("type d'obligation inconnu"));

  // Unités : % et bp convertis à la frontière
  {
    const auto b = bw::io::make_bond(rows[0]);
    const auto y = bw::io::make_yield_spec(rows[0]);
    assert(std::abs(y.rate - 0.05) < EPS);
    assert(std::abs(bw::pricing::price(b, y) - 61.027094285883074) < 1e-9);
  }
  {
    // corporate prix + rendement : rendement = base, spread implicite
    const auto b = bw::io::make_bond(rows[1]);
    const auto y = bw::io::resolve_yield_spec(b, rows[1]);
    assert(std::abs(y.rate - 0.042) < EPS);
    assert(std::abs(y.credit_spread - 0.0013693014846661127) < 1e-9);
    assert(std::abs(bw::pricing::price(b, y) - 98.5) < 1e-8);
  }
  {
    const auto b = bw::io::make_bond(rows[2]);
    const auto y = bw::io::make_yield_spec(rows[2]);
    assert(std::abs(y.inflation - 0.025) < EPS);
    assert(std::abs(y.credit_spread) < EPS);
    assert(b.kind() == bw::market::BondKind::InflationLinked);
  }

  assert(bw::io::find_bond_row(rows, "corp 5y") == &rows[1]);
  assert(bw::io::find_bond_row(rows, "missing") == nullptr);

  // Fichier absent : aucune ligne, un avertissement
  {
    vector<string> w;
    auto none = bw::io::read_bond_csv(dir + "/bonds/does_not_exist.csv", nullptr, &w);
    assert(none.empty() && w.size() == 1);
  }

  // Jeu d'exemple : 4 obligations, prix seul résolu en rendement
  {
    auto sample = bw::io::read_bond_csv(dir + "/bonds/sample_bonds.csv");
    assert(sample.size() == 4);
    const auto* ust = bw::io::find_bond_row(sample, "UST 1.25% 2050");
    assert(ust != nullptr);
    const auto b = bw::io::make_bond(*ust);
    const auto y = bw::io::resolve_yield_spec(b, *ust);
    assert(std::abs(bw::pricing::price(b, y) - 50.036) < 1e-8);
  }

  // Courbe et série de prix
  {
    auto curve = bw::io::read_curve_csv(dir + "/market/treasury_curve.csv");
    assert(curve.points().size() == 6);
    assert(std::abs(curve.rate_at(30.0) - 0.0479) < EPS);
    auto prices = bw::io::read_price_series(dir + "/market/tlt_close.csv");
    assert(prices.size() == 120);
    assert(std::abs(prices.front() - 88.0) < EPS);
  }

  for (auto& w: warnings) cerr << "[warn] " << w << "\n";
  cout << "Bond CSV OK.\n";
  return 0;
}
