#include <fw/projection/settlement.hpp>

#include <algorithm> // std::max
#include <cmath>     // std::isfinite, std::abs

#include <fw/core/money.hpp>
#include <fw/projection/accrual.hpp>

namespace fw {
namespace projection {

PeriodResult settle_period(const fw::market::Fund& fund,
                           const fw::config::ProjectionParams& params,
                           const fw::core::Date& first_date,
                           std::size_t period_index,
                           double opening_balance) {
  const int n_days = fw::core::days_in_month(first_date);
  const double r   = daily_rate(fund.annual_rate);
  const double tax = params.withholding_tax_percent;
  const bool round_daily =
      (params.interest_rounding == fw::config::InterestRounding::DailyToCent);

  PeriodResult res{};
  res.label           = fw::core::month_label(first_date);
  res.first_date      = first_date;
  res.days            = n_days;
  res.opening_balance = opening_balance;
  res.contribution    = (period_index > 0) ? params.monthly_contribution : 0.0;
  res.interest        = 0.0;
  res.fee             = 0.0;
  res.daily.reserve(static_cast<std::size_t>(n_days));

  double balance = opening_balance + res.contribution;

  for (int d = 0; d < n_days; ++d) {
    double interest = day_accrual(balance, r, tax);
    if (round_daily) interest = fw::core::round_half_up_cents(interest);

    balance      += interest;
    res.interest += interest;
    res.daily.push_back(DayEntry{ fw::core::add_days(first_date, d), balance, interest });
  }

  if (params.apply_management_fee) {
    res.fee = management_fee(opening_balance, balance, fund.annual_fee_rate);
    balance -= res.fee;
  }

  res.closing_balance = balance;
  return res;
}

bool is_finite(const PeriodResult& p) noexcept {
  return std::isfinite(p.closing_balance) && std::isfinite(p.interest) && std::isfinite(p.fee);
}

bool is_consistent(const PeriodResult& p, double rel_tol) noexcept {
  const double expected = p.opening_balance + p.contribution + p.interest - p.fee;
  const double scale    = std::max(1.0, std::abs(p.closing_balance));
  return std::abs(expected - p.closing_balance) <= rel_tol * scale;
}

} // namespace projection
} // namespace fw
