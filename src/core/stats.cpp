#include <bw/core/stats.hpp>
#include <bw/core/errors.hpp>

#include <cmath>    // std::sqrt
#include <limits>   // std::numeric_limits

namespace bw {
namespace core {

// --- RunningStats -----------------------------------------------------------

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  return mean_;
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return m2_ / static_cast<double>(n_ - 1);
}

double RunningStats::stddev() const noexcept {
  return std::sqrt(variance());
}

// --- Volatilité glissante ---------------------------------------------------

std::vector<double> rolling_volatility(const std::vector<double>& prices,
                                       std::size_t window,
                                       double periods_per_year)
{
  if (window < 2) {
    throw InvalidInputError("rolling_volatility: window must be >= 2");
  }
  if (!std::isfinite(periods_per_year) || periods_per_year <= 0.0) {
    throw InvalidInputError("rolling_volatility: periods_per_year must be > 0");
  }
  for (double p : prices) {
    if (!std::isfinite(p) || p <= 0.0) {
      throw InvalidInputError("rolling_volatility: prices must be finite and > 0");
    }
  }

  const double nan   = std::numeric_limits<double>::quiet_NaN();
  const double scale = std::sqrt(periods_per_year);

  std::vector<double> out(prices.size(), nan);
  if (prices.size() <= window) return out;

  std::vector<double> returns(prices.size(), nan);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    returns[i] = prices[i] / prices[i - 1] - 1.0;
  }

  for (std::size_t i = window; i < prices.size(); ++i) {
    RunningStats st;
    for (std::size_t k = i + 1 - window; k <= i; ++k) st.add(returns[k]);
    out[i] = st.stddev() * scale;
  }
  return out;
}

} // namespace core
} // namespace bw
