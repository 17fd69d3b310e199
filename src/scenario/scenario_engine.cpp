#include <bw/scenario/scenario_engine.hpp>
#include <bw/pricing/pricing_engine.hpp>
#include <bw/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <future>
#include <string>
#include <thread>

namespace bw {
namespace scenario {

namespace {

using bw::market::ShockAxis;

void check_shocks(const std::vector<double>& shocks, const char* what) {
  for (std::size_t i = 0; i < shocks.size(); ++i) {
    if (!std::isfinite(shocks[i])) {
      throw InvalidInputError(std::string(what) + ": shock #" + std::to_string(i) + " is not finite");
    }
  }
}

// Applique job(i) pour i in [0, n). Avec workers > 1, découpe en tranches
// contiguës sur des std::thread ; chaque tranche écrit dans ses propres cases.
// La première exception (dans l'ordre des tranches) est relancée après join.
void for_each_index(std::size_t n, std::size_t workers,
                    const std::function<void(std::size_t)>& job)
{
  const std::size_t nw = std::min(std::max<std::size_t>(workers, 1), n);
  if (nw <= 1) {
    for (std::size_t i = 0; i < n; ++i) job(i);
    return;
  }

  const std::size_t chunk = (n + nw - 1) / nw;
  std::vector<std::future<void>> results;
  std::vector<std::thread> jobs;
  results.reserve(nw);
  jobs.reserve(nw);

  for (std::size_t w = 0; w < nw; ++w) {
    const std::size_t lo = w * chunk;
    const std::size_t hi = std::min(n, lo + chunk);
    std::packaged_task<void()> task([&job, lo, hi]() {
      for (std::size_t i = lo; i < hi; ++i) job(i);
    });
    results.push_back(task.get_future());
    jobs.emplace_back(std::move(task));
  }

  for (auto& t : jobs) t.join();
  for (auto& r : results) r.get();
}

} // namespace

ScenarioTable run_scenario(const bw::market::Bond& bond,
                           const bw::market::YieldSpec& spec,
                           const std::vector<double>& shocks,
                           ShockAxis axis,
                           const bw::config::ScenarioConfig& cfg)
{
  check_shocks(shocks, "run_scenario");

  ScenarioTable table;
  table.axis        = axis;
  table.base_price  = bw::pricing::price(bond, spec);
  table.sensitivity = bw::risk::axis_sensitivity(bond, spec, axis, cfg.sensitivity);
  table.rows.resize(shocks.size());

  const double p0 = table.base_price;
  const double d  = table.sensitivity.duration;
  const double c  = table.sensitivity.convexity;

  for_each_index(shocks.size(), cfg.workers, [&](std::size_t i) {
    const double dx     = shocks[i];
    const double linear = p0 * (1.0 - d * dx);
    const double exact  = bw::pricing::price(bond, spec.shifted(axis, dx));

    ScenarioRow& row = table.rows[i];
    row.shock                  = dx;
    row.linear_approx_price    = linear;
    row.convexity_approx_price = linear + 0.5 * c * dx * dx * p0;
    row.exact_price            = exact;
    row.percent_change         = (exact - p0) / p0;
  });

  return table;
}

std::vector<GridRow> run_rate_spread_grid(const bw::market::Bond& bond,
                                          const bw::market::YieldSpec& spec,
                                          const std::vector<double>& rate_shocks,
                                          const std::vector<double>& spread_shocks,
                                          const bw::config::ScenarioConfig& cfg)
{
  if (!bond.carries(ShockAxis::Spread)) {
    throw InvalidInputError(std::string("run_rate_spread_grid: ")
                            + bw::market::to_string(bond.kind()) + " bond has no spread axis");
  }
  check_shocks(rate_shocks, "run_rate_spread_grid");
  check_shocks(spread_shocks, "run_rate_spread_grid");

  const double p0 = bw::pricing::price(bond, spec);

  // Variation unidimensionnelle ; NaN si ce choc seul sort du domaine
  // (le choc joint peut rester valide).
  auto leg_change = [&](ShockAxis axis, double dx) {
    try {
      return bw::pricing::price(bond, spec.shifted(axis, dx)) / p0 - 1.0;
    } catch (const DomainError&) {
      return std::numeric_limits<double>::quiet_NaN();
    }
  };

  const std::size_t ns = spread_shocks.size();
  std::vector<GridRow> rows(rate_shocks.size() * ns);

  for_each_index(rows.size(), cfg.workers, [&](std::size_t k) {
    const std::size_t i = k / ns;
    const std::size_t j = k % ns;
    const bw::market::YieldSpec joint =
        spec.shifted(ShockAxis::Rate, rate_shocks[i]).shifted(ShockAxis::Spread, spread_shocks[j]);
    const double exact = bw::pricing::price(bond, joint);
    const double additive = leg_change(ShockAxis::Rate, rate_shocks[i])
                          + leg_change(ShockAxis::Spread, spread_shocks[j]);

    GridRow& row = rows[k];
    row.rate_shock              = rate_shocks[i];
    row.spread_shock            = spread_shocks[j];
    row.exact_price             = exact;
    row.percent_change          = (exact - p0) / p0;
    row.additive_percent_change = additive;
  });

  return rows;
}

} // namespace scenario
} // namespace bw
