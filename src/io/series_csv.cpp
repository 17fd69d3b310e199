#include "bw/io/series_csv.hpp"
#include "csv_util.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace bw::io {

using namespace detail;

namespace {

// Lit l'en-tête et appelle on_row(cells, idx, line_no) pour chaque ligne utile.
template <class OnRow>
bool for_each_row(const std::string& path, std::vector<std::string>* warnings, OnRow on_row) {
  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return false;
  }
  std::string line;
  std::unordered_map<std::string,int> idx;
  bool header_seen = false;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (!content_line(line)) continue;
    auto cells = split_csv_line(line);
    if (!header_seen) {
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;
      header_seen = true;
      continue;
    }
    on_row(cells, idx, line_no);
  }
  return true;
}

std::string cell(const std::vector<std::string>& cells, int i) {
  return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
}

} // namespace

bw::variants::TreasuryCurve
read_curve_csv(const std::string& path,
               std::size_t* num_ignored,
               std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<bw::variants::CurvePoint> pts;

  for_each_row(path, warnings, [&](const std::vector<std::string>& cells,
                                   const std::unordered_map<std::string,int>& idx,
                                   std::size_t line_no) {
    const int iT = col(idx, {"time","t","tenor","years"});
    const int iR = col(idx, {"rate_pct","rate","yield"});
    const double t = parse_double(cell(cells, iT));
    const double r = parse_double(cell(cells, iR));
    if (!std::isfinite(t) || t <= 0.0 || !std::isfinite(r)) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: point de courbe invalide");
      return;
    }
    pts.push_back({ t, r / 100.0 });
  });

  std::sort(pts.begin(), pts.end(),
            [](const bw::variants::CurvePoint& a, const bw::variants::CurvePoint& b) { return a.time < b.time; });
  return bw::variants::TreasuryCurve(std::move(pts));
}

std::vector<double>
read_price_series(const std::string& path,
                  std::size_t* num_ignored,
                  std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<double> out;

  for_each_row(path, warnings, [&](const std::vector<std::string>& cells,
                                   const std::unordered_map<std::string,int>& idx,
                                   std::size_t line_no) {
    int iP = col(idx, {"close","price","adj_close"});
    if (iP < 0) iP = 0;
    const double p = parse_double(cell(cells, iP));
    if (!std::isfinite(p) || p <= 0.0) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: prix invalide");
      return;
    }
    out.push_back(p);
  });

  return out;
}

} // namespace bw::io
