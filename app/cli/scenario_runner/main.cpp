#include "bw/io/bond_csv.hpp"
#include "bw/scenario/scenario_engine.hpp"
#include "bw/variants/credit.hpp"
#include "bw/config/engine_config.hpp"
#include "bw/core/errors.hpp"

#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <cmath>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " -f <bonds.csv> --name NAME"
            << " [--axis rate|spread|inflation]"
            << " [--shocks LIST]   (rate/inflation en %, spread en bp ; ex : -4,-3,-1,1,3)"
            << " [--grid] [--rate-shocks LIST] [--spread-shocks LIST]"
            << " [--workers N] [-o out.csv]\n";
}

// "a,b,c" -> {a,b,c} ; lève std::invalid_argument si un jeton n'est pas numérique.
static std::vector<double> parse_list(const std::string& s) {
  std::vector<double> out;
  std::stringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) continue;
    out.push_back(std::stod(tok));
  }
  return out;
}

static std::vector<double> range(double lo, double hi, double step) {
  std::vector<double> out;
  const int n = static_cast<int>(std::floor((hi - lo) / step + 0.5));
  for (int i=0;i<=n;++i) out.push_back(lo + step * i);
  return out;
}

// Unité d'affichage de l'axe : % pour rate/inflation, bp pour spread.
static double display_scale(bw::market::ShockAxis axis) {
  return axis == bw::market::ShockAxis::Spread ? 10000.0 : 100.0;
}

int main(int argc, char** argv) {
  std::string path, name, out_path, axis_s = "rate";
  std::string shocks_s, rate_s, spread_s;
  bool grid = false;
  bw::config::ScenarioConfig cfg;

  try {
    for (int i=1;i<argc;++i) {
      std::string a = argv[i];
      if ((a=="-f" || a=="--file") && i+1<argc) path = argv[++i];
      else if (a=="--name" && i+1<argc) name = argv[++i];
      else if (a=="--axis" && i+1<argc) axis_s = argv[++i];
      else if (a=="--shocks" && i+1<argc) shocks_s = argv[++i];
      else if (a=="--grid") grid = true;
      else if (a=="--rate-shocks" && i+1<argc) rate_s = argv[++i];
      else if (a=="--spread-shocks" && i+1<argc) spread_s = argv[++i];
      else if (a=="--workers" && i+1<argc) cfg.workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      else if (a=="-o" && i+1<argc) out_path = argv[++i];
      else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  if (path.empty() || name.empty()) { usage(argv[0]); return 1; }

  bw::market::ShockAxis axis;
  if      (axis_s=="rate")      axis = bw::market::ShockAxis::Rate;
  else if (axis_s=="spread")    axis = bw::market::ShockAxis::Spread;
  else if (axis_s=="inflation") axis = bw::market::ShockAxis::Inflation;
  else { std::cerr << "Unknown axis: " << axis_s << "\n"; usage(argv[0]); return 1; }

  const double scale = display_scale(axis);
  std::vector<double> shocks, rate_shocks, spread_shocks;
  try {
    if (!shocks_s.empty()) {
      for (double v : parse_list(shocks_s)) shocks.push_back(v / scale);
    } else if (axis == bw::market::ShockAxis::Spread) {
      for (double v : range(-500.0, 500.0, 50.0)) shocks.push_back(v / scale);
    } else {
      for (double v : range(-4.0, 4.0, 0.5)) shocks.push_back(v / scale);
    }
    for (double v : (rate_s.empty() ? range(-2.0, 2.0, 0.5) : parse_list(rate_s))) {
      rate_shocks.push_back(v / 100.0);
    }
    for (double v : (spread_s.empty() ? std::vector<double>{-500, -250, 0, 250, 500} : parse_list(spread_s))) {
      spread_shocks.push_back(bw::variants::bps_to_fraction(v));
    }
  } catch (const std::exception&) {
    std::cerr << "Invalid shock list\n"; usage(argv[0]); return 1;
  }

  std::size_t ignored = 0;
  const auto rows = bw::io::read_bond_csv(path, &ignored, nullptr);
  const bw::io::BondRow* row = bw::io::find_bond_row(rows, name);
  if (!row) { std::cerr << "Error: no bond named '" << name << "' in " << path << "\n"; return 2; }

  try {
    const bw::market::Bond bond = bw::io::make_bond(*row);
    const bw::market::YieldSpec y = bw::io::resolve_yield_spec(bond, *row);

    const bool export_csv = !out_path.empty();
    std::ofstream csv;
    if (export_csv) {
      csv.open(out_path);
      if (!csv) { std::cerr << "Error: cannot write " << out_path << "\n"; return 2; }
      csv.setf(std::ios::fixed);
      csv << std::setprecision(8);
    }

    std::cout.setf(std::ios::fixed);

    if (grid) {
      const auto g = bw::scenario::run_rate_spread_grid(bond, y, rate_shocks, spread_shocks, cfg);
      std::cout << "Rate x spread grid: " << row->name << "  (" << g.size() << " cells)\n";
      std::cout << std::setw(10) << "dr(%)" << std::setw(10) << "ds(bp)"
                << std::setw(14) << "price" << std::setw(12) << "joint(%)"
                << std::setw(14) << "additive(%)" << "\n";
      if (export_csv) csv << "rate_shock,spread_shock,exact_price,percent_change,additive_percent_change\n";
      for (const auto& r : g) {
        std::cout << std::setprecision(2)
                  << std::setw(10) << 100.0 * r.rate_shock
                  << std::setw(10) << bw::variants::fraction_to_bps(r.spread_shock)
                  << std::setprecision(4)
                  << std::setw(14) << r.exact_price
                  << std::setw(12) << 100.0 * r.percent_change
                  << std::setw(14) << 100.0 * r.additive_percent_change << "\n";
        if (export_csv) csv << r.rate_shock << "," << r.spread_shock << "," << r.exact_price << ","
                     << r.percent_change << "," << r.additive_percent_change << "\n";
      }
    } else {
      const auto t = bw::scenario::run_scenario(bond, y, shocks, axis, cfg);
      std::cout << std::setprecision(4)
                << "Scenario: " << row->name << "  axis=" << bw::market::to_string(axis)
                << "  P0=" << t.base_price
                << "  D=" << t.sensitivity.duration
                << "  C=" << t.sensitivity.convexity << "\n";
      std::cout << std::setw(10) << (axis == bw::market::ShockAxis::Spread ? "shock(bp)" : "shock(%)")
                << std::setw(14) << "linear" << std::setw(14) << "convexity"
                << std::setw(14) << "exact" << std::setw(12) << "change(%)" << "\n";
      if (export_csv) csv << "shock,linear_approx_price,convexity_approx_price,exact_price,percent_change\n";
      for (const auto& r : t.rows) {
        std::cout << std::setprecision(2) << std::setw(10) << scale * r.shock
                  << std::setprecision(4)
                  << std::setw(14) << r.linear_approx_price
                  << std::setw(14) << r.convexity_approx_price
                  << std::setw(14) << r.exact_price
                  << std::setw(12) << 100.0 * r.percent_change << "\n";
        if (export_csv) csv << r.shock << "," << r.linear_approx_price << "," << r.convexity_approx_price
                     << "," << r.exact_price << "," << r.percent_change << "\n";
      }
    }

    if (export_csv) std::cout << "Written: " << out_path << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
