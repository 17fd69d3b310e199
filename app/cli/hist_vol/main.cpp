#include "bw/io/series_csv.hpp"
#include "bw/core/stats.hpp"

#include <cmath>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog << " <prices.csv> [--window N] [--periods-per-year N] [--all] [-w]\n";
}

int main(int argc, char** argv) {
  std::string path;
  std::size_t window = 30;
  double periods = 252.0;
  bool all = false, show_warnings = false;

  try {
    for (int i=1;i<argc;++i) {
      std::string a = argv[i];
      if (a=="--window" && i+1<argc) window = static_cast<std::size_t>(std::stoul(argv[++i]));
      else if (a=="--periods-per-year" && i+1<argc) periods = std::stod(argv[++i]);
      else if (a=="--all") all = true;
      else if (a=="-w" || a=="--show-warnings") show_warnings = true;
      else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
      else if (path.empty()) path = a;
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }
  if (path.empty()) { usage(argv[0]); return 1; }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  const auto prices = bw::io::read_price_series(path, &ignored, &warnings);
  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }

  try {
    const auto vol = bw::core::rolling_volatility(prices, window, periods);

    std::cout << "File: " << path << "  (" << prices.size() << " prices, ignored " << ignored << ")\n";
    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(4);
    if (all) {
      for (std::size_t i=0;i<vol.size();++i) {
        if (std::isnan(vol[i])) continue;
        std::cout << i << "," << prices[i] << "," << 100.0 * vol[i] << "\n";
      }
    }
    if (vol.empty() || std::isnan(vol.back())) {
      std::cout << "Not enough prices for a " << window << "-period window.\n";
    } else {
      std::cout << "Latest " << window << "-period vol: " << 100.0 * vol.back() << " % (annualised)\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
