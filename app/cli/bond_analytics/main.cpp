#include "bw/io/bond_csv.hpp"
#include "bw/io/series_csv.hpp"
#include "bw/pricing/pricing_engine.hpp"
#include "bw/pricing/ytm_solver.hpp"
#include "bw/risk/sensitivity.hpp"
#include "bw/variants/credit.hpp"
#include "bw/variants/inflation.hpp"
#include "bw/config/engine_config.hpp"
#include "bw/core/errors.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cmath>
#include <limits>
#include <memory>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " -f <bonds.csv> [--name NAME] [-w]"
            << " [--method analytic|fd] [--bump VAL]"
            << " [--fallback bisection|none]"
            << " [--curve <curve.csv>]"
            << " [--nominal-yield PCT]\n";
}

static void print_bond(const bw::io::BondRow& row,
                       const bw::config::EngineConfig& cfg,
                       const bw::variants::TreasuryCurve* curve,
                       double nominal_yield)
{
  using bw::market::ShockAxis;

  const bw::market::Bond bond = bw::io::make_bond(row);
  const bw::market::YieldSpec y = bw::io::resolve_yield_spec(bond, row, cfg.solver);
  const bw::risk::SensitivityResult s = bw::risk::sensitivities(bond, y, cfg.sensitivity);

  std::cout << "=== " << (row.name.empty() ? std::string("(unnamed)") : row.name)
            << " [" << bw::market::to_string(bond.kind()) << "] ===\n";
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(4);
  std::cout << "coupon        : " << row.coupon_pct << " %\n"
            << "maturity      : " << row.maturity << " y  (" << bond.schedule().size() << " flows)\n"
            << "price         : " << s.price << "\n";

  if (bond.carries(ShockAxis::Spread)) {
    std::cout << "base rate     : " << 100.0 * y.rate << " %\n"
              << "credit spread : " << bw::variants::fraction_to_bps(y.credit_spread) << " bp\n"
              << "total yield   : " << 100.0 * bond.discount_rate(y) << " %\n";
  } else if (bond.carries(ShockAxis::Inflation)) {
    std::cout << "real yield    : " << 100.0 * y.rate << " %\n"
              << "inflation     : " << 100.0 * y.inflation << " %\n";
  } else {
    std::cout << "yield         : " << 100.0 * y.rate << " %\n";
  }

  std::cout << "mod. duration : " << s.modified_duration << "\n"
            << "mac. duration : " << s.macaulay_duration << "\n"
            << "convexity     : " << s.convexity << "\n"
            << "DV01          : " << s.dv01 << "\n";
  if (s.credit_spread_duration) std::cout << "spread dur.   : " << *s.credit_spread_duration << "\n";
  if (s.inflation_duration)     std::cout << "infl. dur.    : " << *s.inflation_duration << "\n";

  const double par_shift = bw::pricing::yield_shift_to_price(bond, y, bond.terms().face_value, cfg.solver);
  std::cout << "shift to par  : " << 100.0 * par_shift << " %\n";

  if (const auto recovery = bond.recovery_rate()) {
    const double pd = bw::variants::default_probability(y.credit_spread, *recovery);
    std::cout << "default prob. : " << 100.0 * pd << " % / y  (recovery "
              << *recovery << ")\n";
    if (curve) {
      const auto z = bw::variants::z_spread(bond, s.price, *curve, cfg.solver);
      std::cout << "Z-spread      : " << bw::variants::fraction_to_bps(z.spread) << " bp ("
                << z.iterations << " iters)\n";
    }
  }

  if (bond.carries(ShockAxis::Inflation) && std::isfinite(nominal_yield)) {
    const auto be = bw::variants::breakeven_inflation(bond, nominal_yield, y.rate, cfg.solver);
    std::cout << "breakeven     : " << 100.0 * be.inflation << " % (simple "
              << 100.0 * bw::variants::breakeven_simple(nominal_yield, y.rate) << " %)\n";
  }
  std::cout << "\n";
}

// Analyse une obligation ; en cas d'échec, signale l'obligation fautive et rend false.
static bool analyze_bond(const bw::io::BondRow& row,
                         const bw::config::EngineConfig& cfg,
                         const bw::variants::TreasuryCurve* curve,
                         double nominal_yield)
{
  const std::string label = row.name.empty() ? std::string("(unnamed)") : row.name;
  try {
    print_bond(row, cfg, curve, nominal_yield);
    return true;
  } catch (const bw::ConvergenceError& e) {
    std::cout << "\n";
    std::cerr << "Error: " << label << ": " << e.what() << " (iterations " << e.iterations()
              << ", last estimate " << e.last_estimate() << ")\n";
  } catch (const std::exception& e) {
    std::cout << "\n";
    std::cerr << "Error: " << label << ": " << e.what() << "\n";
  }
  return false;
}

int main(int argc, char** argv) {
  std::string path, name, curve_path;
  bool show_warnings = false;
  double nominal_yield = std::numeric_limits<double>::quiet_NaN();
  bw::config::EngineConfig cfg;

  try {
    for (int i=1;i<argc;++i) {
      std::string a = argv[i];
      if ((a=="-f" || a=="--file") && i+1<argc) path = argv[++i];
      else if (a=="--name" && i+1<argc) name = argv[++i];
      else if (a=="-w" || a=="--show-warnings") show_warnings = true;
      else if (a=="--curve" && i+1<argc) curve_path = argv[++i];
      else if (a=="--nominal-yield" && i+1<argc) nominal_yield = std::stod(argv[++i]) / 100.0;
      else if (a=="--bump" && i+1<argc) cfg.sensitivity.bump = std::stod(argv[++i]);
      else if (a=="--method" && i+1<argc) {
        std::string m = argv[++i];
        if (m=="fd") cfg.sensitivity.method = bw::config::SensitivityMethod::FiniteDifference;
        else if (m=="analytic") cfg.sensitivity.method = bw::config::SensitivityMethod::Analytic;
        else { std::cerr << "Unknown method: " << m << "\n"; usage(argv[0]); return 1; }
      }
      else if (a=="--fallback" && i+1<argc) {
        std::string m = argv[++i];
        if (m=="none") cfg.solver.fallback = bw::config::SolverFallback::None;
        else if (m=="bisection") cfg.solver.fallback = bw::config::SolverFallback::Bisection;
        else { std::cerr << "Unknown fallback: " << m << "\n"; usage(argv[0]); return 1; }
      }
      else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
      else if (path.empty()) path = a;
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  if (path.empty()) { usage(argv[0]); return 1; }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  const auto rows = bw::io::read_bond_csv(path, &ignored, &warnings);
  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  std::cout << "File: " << path << "  (valid " << rows.size() << ", ignored " << ignored << ")\n\n";

  std::unique_ptr<bw::variants::TreasuryCurve> curve;
  try {
    std::vector<std::string> curve_warnings;
    if (!curve_path.empty()) {
      curve = std::make_unique<bw::variants::TreasuryCurve>(
          bw::io::read_curve_csv(curve_path, nullptr, &curve_warnings));
      if (show_warnings) {
        for (auto& w : curve_warnings) std::cerr << "[warn] " << w << "\n";
      }
    }

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  // Une obligation en échec n'interrompt pas les suivantes.
  std::size_t failures = 0;
  if (!name.empty()) {
    const bw::io::BondRow* row = bw::io::find_bond_row(rows, name);
    if (!row) { std::cerr << "Error: no bond named '" << name << "'\n"; return 2; }
    if (!analyze_bond(*row, cfg, curve.get(), nominal_yield)) ++failures;
  } else {
    for (const auto& row : rows) {
      if (!analyze_bond(row, cfg, curve.get(), nominal_yield)) ++failures;
    }
  }

  if (failures > 0) {
    std::cerr << failures << " bond(s) failed\n";
    return 2;
  }
  return 0;
}
