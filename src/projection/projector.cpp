#include <fw/projection/projector.hpp>

#include <cmath>     // std::isfinite
#include <stdexcept> // std::exception
#include <utility>   // std::move

namespace fw {
namespace projection {

namespace {

// Tolérance relative de l’invariant de clôture (somme flottante des intérêts).
constexpr double CLOSING_REL_TOL = 1e-9;

PeriodSummary summarize(const PeriodResult& p) {
  return PeriodSummary{ p.label, p.first_date, p.days, p.opening_balance,
                        p.contribution, p.interest, p.fee, p.closing_balance };
}

} // namespace

std::string CalculationFailure::message() const {
  return "Error calculating returns for " + fund_name + ": " + reason;
}

ProjectionOutcome project(const fw::market::Fund& fund,
                          const fw::config::ProjectionParams& params) {
  ProjectionResult res;
  res.fund_name = fund.name;

  double balance      = params.initial_capital;
  double contributed  = params.initial_capital;
  fw::core::Date date = params.start_date;

  const std::size_t n_periods = static_cast<std::size_t>(params.horizon_months);

  try {
    res.monthly_balances.reserve(n_periods + 1);
    res.periods.reserve(n_periods);
    res.monthly_balances.push_back(BalancePoint{ fw::core::month_label(date), date, balance });

    for (std::size_t k = 0; k < n_periods; ++k) {
      PeriodResult period = settle_period(fund, params, date, k, balance);

      if (!is_finite(period)) {
        return CalculationFailure{ fund.name,
            "non-finite balance in " + period.label };
      }
      if (!is_consistent(period, CLOSING_REL_TOL)) {
        return CalculationFailure{ fund.name,
            "closing balance inconsistent with interest and fee in " + period.label };
      }

      balance             = period.closing_balance;
      res.total_interest += period.interest;
      res.total_fees     += period.fee;
      if (k > 0) contributed += params.monthly_contribution;

      date = fw::core::add_months(date, 1);
      res.monthly_balances.push_back(BalancePoint{ fw::core::month_label(date), date, balance });
      res.periods.push_back(summarize(period));

      if (params.keep_daily_series) {
        res.daily.insert(res.daily.end(), period.daily.begin(), period.daily.end());
      }
    }
  } catch (const std::exception& e) {
    return CalculationFailure{ fund.name, e.what() };
  }

  res.final_balance      = balance;
  res.total_contributed  = contributed;
  res.net_return_percent = (contributed != 0.0)
      ? (balance - contributed) / contributed * 100.0
      : 0.0;

  if (!std::isfinite(res.total_interest) || !std::isfinite(res.net_return_percent)) {
    return CalculationFailure{ fund.name, "non-finite totals" };
  }
  return ProjectionOutcome{ std::move(res) };
}

} // namespace projection
} // namespace fw
