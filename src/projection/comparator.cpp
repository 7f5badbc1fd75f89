#include <fw/projection/comparator.hpp>

#include <algorithm> // std::stable_sort, std::min_element
#include <numeric>   // std::iota

#include <fw/core/money.hpp>

namespace fw {
namespace projection {

namespace {

// Message quand tous les fonds sont exclus : on cite l’option la plus accessible.
std::string below_minimum_message(const std::vector<fw::market::Fund>& funds, double capital) {
  auto lowest = std::min_element(funds.begin(), funds.end(),
      [](const fw::market::Fund& a, const fw::market::Fund& b) {
        return a.minimum_investment < b.minimum_investment;
      });
  return "Initial capital of " + fw::core::format_currency(capital)
       + " is below the minimum investment requirement. Lowest available option is "
       + fw::core::format_currency(lowest->minimum_investment)
       + " (" + lowest->name + ")";
}

} // namespace

ComparisonReport compare(const std::vector<fw::market::Fund>& funds,
                         const fw::config::ProjectionParams& params) {
  if (funds.empty()) {
    throw NoResultsError("No funds to compare");
  }

  ComparisonReport report;
  std::vector<RankedFund> unsorted;
  unsorted.reserve(funds.size());

  for (const auto& fund : funds) {
    if (fund.minimum_investment > params.initial_capital) {
      report.excluded.push_back(FundNote{ fund,
          "requires a minimum investment of " + fw::core::format_currency(fund.minimum_investment) });
      continue;
    }

    ProjectionOutcome outcome = project(fund, params);
    if (auto* failure = std::get_if<CalculationFailure>(&outcome)) {
      report.warnings.push_back(FundNote{ fund, failure->message() });
      continue;
    }
    unsorted.push_back(RankedFund{ fund, std::get<ProjectionResult>(std::move(outcome)) });
  }

  if (unsorted.empty()) {
    if (report.excluded.size() == funds.size()) {
      throw NoResultsError(below_minimum_message(funds, params.initial_capital));
    }
    throw NoResultsError("No valid results calculated for any fund");
  }

  // Fund n’est pas assignable (membres const) : on trie des indices.
  std::vector<std::size_t> order(unsorted.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return unsorted[a].result.final_balance > unsorted[b].result.final_balance;
  });

  report.ranked.reserve(unsorted.size());
  for (std::size_t i : order) {
    report.ranked.push_back(std::move(unsorted[i]));
  }
  return report;
}

} // namespace projection
} // namespace fw
