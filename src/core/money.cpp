#include <fw/core/money.hpp>

#include <cmath>   // std::isfinite, std::llround
#include <cstdio>  // std::snprintf

namespace fw {
namespace core {

std::string format_amount(double amount) {
  if (!std::isfinite(amount)) return std::isnan(amount) ? "nan" : (amount > 0 ? "inf" : "-inf");

  const long long cents = std::llround(round_half_up_cents(amount) * 100.0);
  const bool negative   = cents < 0;
  const long long abs_c = negative ? -cents : cents;

  // Partie entière groupée par 3 chiffres
  std::string units = std::to_string(abs_c / 100);
  std::string grouped;
  grouped.reserve(units.size() + units.size() / 3);
  const std::size_t lead = units.size() % 3;
  for (std::size_t i = 0; i < units.size(); ++i) {
    if (i != 0 && (i % 3) == lead) grouped.push_back(',');
    grouped.push_back(units[i]);
  }

  char frac[4];
  std::snprintf(frac, sizeof(frac), "%02lld", abs_c % 100);
  return (negative ? "-" : "") + grouped + "." + frac;
}

std::string format_currency(double amount) {
  return "KES " + format_amount(amount);
}

} // namespace core
} // namespace fw
