#include <bw/pricing/pricing_engine.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <sstream>

namespace bw {
namespace pricing {

namespace {

// Base périodique 1 + y/f, vérifiée > 0.
inline double periodic_base(double rate, int f) {
  const double base = 1.0 + rate / static_cast<double>(f);
  if (!std::isfinite(base) || base <= 0.0) {
    std::ostringstream os;
    os << "discount base 1 + y/f = " << base << " <= 0 (y=" << rate << ", f=" << f << ")";
    throw DomainError(os.str());
  }
  return base;
}

} // namespace

double discount_factor(double rate, int payments_per_year, double t) {
  const double base = periodic_base(rate, payments_per_year);
  return std::pow(base, -t * static_cast<double>(payments_per_year));
}

double present_value(const bw::cashflows::CashFlowSchedule& schedule, double rate) {
  const int    f    = schedule.payments_per_year();
  const double fd   = static_cast<double>(f);
  const double base = periodic_base(rate, f);

  double pv = 0.0;
  for (const auto& cf : schedule) {
    pv += cf.amount * std::pow(base, -cf.time * fd);
  }
  return pv;
}

YieldDerivatives yield_derivatives(const bw::cashflows::CashFlowSchedule& schedule, double rate) {
  const int    f    = schedule.payments_per_year();
  const double fd   = static_cast<double>(f);
  const double base = periodic_base(rate, f);

  double pv = 0.0, s1 = 0.0, s2 = 0.0;
  for (const auto& cf : schedule) {
    const double v = cf.amount * std::pow(base, -cf.time * fd);
    pv += v;
    s1 += cf.time * v;
    s2 += cf.time * (cf.time + 1.0 / fd) * v;
  }
  return { pv, -s1 / base, s2 / (base * base) };
}

double price(const bw::market::Bond& bond, const bw::market::YieldSpec& y) {
  return present_value(bond.cash_flows(y), bond.discount_rate(y));
}

} // namespace pricing
} // namespace bw
