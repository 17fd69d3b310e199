#include "bw/io/bond_csv.hpp"
#include "bw/core/errors.hpp"
#include "bw/variants/credit.hpp"
#include "bw/pricing/ytm_solver.hpp"
#include "csv_util.hpp"

#include <fstream>
#include <cmath>

namespace {

using namespace bw::io::detail;

static bw::market::FractionalPeriod parse_stub(std::string s) {
  s = lower(trim(s));
  if (s.empty() || s=="reject" || s=="none") return bw::market::FractionalPeriod::Reject;
  if (s=="short_first" || s=="shortfirst" || s=="short") return bw::market::FractionalPeriod::ShortFirst;
  throw bw::InvalidInputError("stub inconnu: " + s);
}

} // namespace

namespace bw::io {

using namespace detail;
using bw::market::BondKind;

BondKind parse_bond_kind(const std::string& raw) {
  const std::string s = lower(trim(raw));
  if (s.empty() || s=="nominal" || s=="treasury" || s=="gilt") return BondKind::Nominal;
  if (s=="inflation" || s=="inflation_linked" || s=="linker" || s=="tips") return BondKind::InflationLinked;
  if (s=="corporate" || s=="corp" || s=="credit") return BondKind::Corporate;
  throw bw::InvalidInputError("type d'obligation inconnu: " + raw);
}

bw::market::Bond make_bond(const BondRow& row) {
  bw::market::BondTerms terms(row.coupon_pct / 100.0, row.face, row.freq, row.maturity, row.stub);
  switch (row.kind) {
    case BondKind::InflationLinked:
      return bw::market::Bond::inflation_linked(
          terms, bw::variants::InflationIndexation(row.base_index, row.current_index, row.lag_months),
          row.name);
    case BondKind::Corporate:
      return bw::market::Bond::corporate(terms, bw::variants::CreditSpreadOverlay(row.recovery), row.name);
    case BondKind::Nominal:
      break;
  }
  return bw::market::Bond::nominal(terms, row.name);
}

bw::market::YieldSpec make_yield_spec(const BondRow& row) {
  bw::market::YieldSpec y;
  y.rate          = row.yield_pct / 100.0;
  y.credit_spread = row.kind == BondKind::Corporate ? bw::variants::bps_to_fraction(row.spread_bps) : 0.0;
  y.inflation     = row.kind == BondKind::InflationLinked ? row.inflation_pct / 100.0 : 0.0;
  return y;
}

bw::market::YieldSpec resolve_yield_spec(const bw::market::Bond& bond,
                                         const BondRow& row,
                                         const bw::config::SolverConfig& cfg) {
  bw::market::YieldSpec y = make_yield_spec(row);
  if (std::isnan(row.price)) return y;

  if (!std::isnan(row.yield_pct)) {
    if (bond.carries(bw::market::ShockAxis::Spread)) {
      y.credit_spread = bw::pricing::solve_credit_spread(bond, row.price, y.rate,
                                                         y.credit_spread, cfg).yield;
    }
    return y;
  }

  y.rate = bw::pricing::solve_yield(bond, row.price, y, 0.05, cfg).yield;
  return y;
}

const BondRow* find_bond_row(const std::vector<BondRow>& rows, const std::string& name) {
  const std::string key = lower(trim(name));
  for (const auto& r : rows) {
    if (lower(r.name) == key) return &r;
  }
  return nullptr;
}

std::vector<BondRow>
read_bond_csv(const std::string& path,
              std::size_t* num_ignored,
              std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<BondRow> out;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return out;
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

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };
    auto num_or = [&](int i, double def) {
      const std::string s = get(i);
      return s.empty() ? def : parse_double(s);
    };

    const int iName   = col(idx, {"name","bond","id"});
    const int iKind   = col(idx, {"kind","type"});
    const int iCoupon = col(idx, {"coupon_pct","coupon"});
    const int iFace   = col(idx, {"face","face_value","par"});
    const int iFreq   = col(idx, {"freq","frequency","payments_per_year"});
    const int iMat    = col(idx, {"maturity","years","t"});
    const int iStub   = col(idx, {"stub","fractional_period"});
    const int iPrice  = col(idx, {"price","market_price"});
    const int iYield  = col(idx, {"yield_pct","yield","ytm"});
    const int iSpread = col(idx, {"spread_bps","spread"});
    const int iRec    = col(idx, {"recovery","recovery_rate"});
    const int iBase   = col(idx, {"base_index"});
    const int iCur    = col(idx, {"current_index"});
    const int iLag    = col(idx, {"lag_months","lag"});
    const int iInfl   = col(idx, {"inflation_pct","inflation"});

    BondRow row;
    std::string why;
    try {
      row.name          = get(iName);
      row.kind          = parse_bond_kind(get(iKind));
      row.coupon_pct    = parse_double(get(iCoupon));
      row.face          = num_or(iFace, 100.0);
      row.maturity      = parse_double(get(iMat));
      row.stub          = parse_stub(get(iStub));
      row.price         = parse_double(get(iPrice));
      row.yield_pct     = parse_double(get(iYield));
      row.spread_bps    = num_or(iSpread, 0.0);
      row.recovery      = num_or(iRec, 0.4);
      row.base_index    = num_or(iBase, 1.0);
      row.current_index = num_or(iCur, 1.0);
      row.inflation_pct = num_or(iInfl, 0.0);

      const double freq = num_or(iFreq, 2.0);
      const double lag  = num_or(iLag, 3.0);
      if (!std::isfinite(freq) || freq != std::floor(freq)) throw bw::InvalidInputError("freq non entier");
      if (!std::isfinite(lag)  || lag  != std::floor(lag))  throw bw::InvalidInputError("lag_months non entier");
      row.freq       = static_cast<int>(freq);
      row.lag_months = static_cast<int>(lag);

      if (std::isnan(row.price) && std::isnan(row.yield_pct)) {
        throw bw::InvalidInputError("ni prix ni rendement");
      }
      if (!std::isnan(row.price) && row.price <= 0.0) {
        throw bw::InvalidInputError("prix <= 0");
      }
      if (!std::isfinite(row.spread_bps) || !std::isfinite(row.inflation_pct)) {
        throw bw::InvalidInputError("spread ou inflation invalide");
      }

      // validation complète des termes et de la variante
      (void)make_bond(row);
    } catch (const bw::InvalidInputError& e) {
      why = e.what();
    } catch (const bw::DomainError& e) {
      why = e.what();
    }

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + why);
      continue;
    }

    out.push_back(row);
  }

  return out;
}

} // namespace bw::io
