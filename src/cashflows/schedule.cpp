#include <bw/cashflows/schedule.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace bw {
namespace cashflows {

namespace {
// Tolérance sur T * f pour considérer le nombre de périodes comme entier.
constexpr double PERIOD_TOL = 1e-6;
} // namespace

CashFlowSchedule::CashFlowSchedule(std::vector<CashFlow> flows, int payments_per_year)
  : flows_(std::move(flows)), freq_(payments_per_year) {
  if (freq_ < 1) {
    throw InvalidInputError("CashFlowSchedule: payments_per_year must be >= 1");
  }
  if (flows_.empty()) {
    throw InvalidInputError("CashFlowSchedule: empty schedule");
  }
  double prev = 0.0;
  for (std::size_t i = 0; i < flows_.size(); ++i) {
    const CashFlow& cf = flows_[i];
    if (!std::isfinite(cf.time) || !std::isfinite(cf.amount)) {
      throw InvalidInputError("CashFlowSchedule: non-finite flow at index " + std::to_string(i));
    }
    if (cf.time <= prev) {
      // couvre aussi t <= 0 pour le premier flux
      throw InvalidInputError("CashFlowSchedule: times must be > 0 and strictly increasing (index "
                              + std::to_string(i) + ")");
    }
    prev = cf.time;
  }
}

double CashFlowSchedule::total_amount() const noexcept {
  double s = 0.0;
  for (const auto& cf : flows_) s += cf.amount;
  return s;
}

CashFlowSchedule
CashFlowSchedule::with_amounts(const std::function<double(double, double)>& fn) const {
  std::vector<CashFlow> out;
  out.reserve(flows_.size());
  for (const auto& cf : flows_) out.push_back({ cf.time, fn(cf.time, cf.amount) });
  return CashFlowSchedule(std::move(out), freq_);
}

CashFlowSchedule build_schedule(const bw::market::BondTerms& terms) {
  const int    f       = terms.payments_per_year;
  const double fd      = static_cast<double>(f);
  const double T       = terms.years_to_maturity;
  const double periods = T * fd;
  const double rounded = std::round(periods);
  const double coupon  = terms.coupon_amount();

  std::vector<CashFlow> flows;

  if (std::fabs(periods - rounded) <= PERIOD_TOL * std::max(1.0, periods) && rounded >= 1.0) {
    // Cas régulier : t_k = k/f
    const long n = static_cast<long>(rounded);
    flows.reserve(static_cast<std::size_t>(n));
    for (long k = 1; k <= n; ++k) {
      flows.push_back({ static_cast<double>(k) / fd, coupon });
    }
  } else {
    if (terms.fractional_period == bw::market::FractionalPeriod::Reject) {
      throw InvalidInputError("build_schedule: years_to_maturity * payments_per_year = "
                              + std::to_string(periods)
                              + " is not a positive integer (use FractionalPeriod::ShortFirst)");
    }
    // Ancrage à maturité : la première période est courte, coupons pleins.
    const long n = static_cast<long>(std::ceil(periods - PERIOD_TOL));
    flows.reserve(static_cast<std::size_t>(n));
    for (long k = 1; k <= n; ++k) {
      const double t = T - static_cast<double>(n - k) / fd;
      flows.push_back({ t, coupon });
    }
  }

  flows.back().amount += terms.face_value;
  return CashFlowSchedule(std::move(flows), f);
}

} // namespace cashflows
} // namespace bw
