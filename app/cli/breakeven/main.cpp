#include "bw/io/bond_csv.hpp"
#include "bw/variants/inflation.hpp"
#include "bw/market/bond.hpp"
#include "bw/config/engine_config.hpp"
#include "bw/core/errors.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " NOMINAL_PCT REAL_PCT"
            << " [--coupon PCT] [--maturity Y] [--freq N]"
            << " [-f <bonds.csv> --name NAME]\n"
            << "  (l'obligation donne le profil de flux du root-find ; défaut : 0.125 %, 49 ans, semestriel)\n";
}

int main(int argc, char** argv) {
  if (argc < 3) { usage(argv[0]); return 1; }

  double nominal, real;
  double coupon_pct = 0.125, maturity = 49.0;
  int freq = 2;
  std::string path, name;
  try {
    nominal = std::stod(argv[1]) / 100.0;
    real    = std::stod(argv[2]) / 100.0;
    for (int i=3;i<argc;++i) {
      std::string a = argv[i];
      if (a=="--coupon" && i+1<argc) coupon_pct = std::stod(argv[++i]);
      else if (a=="--maturity" && i+1<argc) maturity = std::stod(argv[++i]);
      else if (a=="--freq" && i+1<argc) freq = std::stoi(argv[++i]);
      else if ((a=="-f" || a=="--file") && i+1<argc) path = argv[++i];
      else if (a=="--name" && i+1<argc) name = argv[++i];
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  try {
    bw::io::BondRow row;
    row.kind       = bw::market::BondKind::InflationLinked;
    row.coupon_pct = coupon_pct;
    row.maturity   = maturity;
    row.freq       = freq;
    row.stub       = bw::market::FractionalPeriod::ShortFirst;

    if (!path.empty()) {
      const auto rows = bw::io::read_bond_csv(path);
      const bw::io::BondRow* found = bw::io::find_bond_row(rows, name);
      if (!found) { std::cerr << "Error: no bond named '" << name << "' in " << path << "\n"; return 2; }
      row = *found;
    }

    const bw::market::Bond bond = bw::io::make_bond(row);
    const auto be = bw::variants::breakeven_inflation(bond, nominal, real);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(4)
              << "nominal yield : " << 100.0 * nominal << " %\n"
              << "real yield    : " << 100.0 * real << " %\n"
              << "simple        : " << 100.0 * bw::variants::breakeven_simple(nominal, real) << " %\n"
              << "fisher        : " << 100.0 * bw::variants::fisher_breakeven(nominal, real) << " %\n"
              << "root-find     : " << 100.0 * be.inflation << " %  (" << be.iterations << " iters"
              << (be.used_bisection ? ", bisection" : "") << ")\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
