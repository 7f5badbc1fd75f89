#include "fw/core/calendar.hpp"
#include "fw/core/money.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using fw::core::Date;

template <class F>
static bool throws_invalid(F f) {
  try { f(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

int main() {
  // 1) Années bissextiles & longueur des mois
  assert(fw::core::is_leap_year(2024));
  assert(fw::core::is_leap_year(2000));
  assert(!fw::core::is_leap_year(1900));
  assert(!fw::core::is_leap_year(2023));

  assert(fw::core::days_in_month(2024, 2) == 29);
  assert(fw::core::days_in_month(2023, 2) == 28);
  assert(fw::core::days_in_month(2024, 4) == 30);
  assert(fw::core::days_in_month(2024, 12) == 31);
  assert(throws_invalid([]{ fw::core::days_in_month(2024, 13); }));

  // 2) Ajout de mois : écrêtage du jour
  const Date jan31_23{2023, 1, 31};
  const Date jan31_24{2024, 1, 31};
  assert((fw::core::add_months(jan31_23, 1) == Date{2023, 2, 28}));
  assert((fw::core::add_months(jan31_24, 1) == Date{2024, 2, 29}));

  // un mois à la fois : la dérive de l’écrêtage se conserve
  assert((fw::core::add_months(fw::core::add_months(jan31_23, 1), 1) == Date{2023, 3, 28}));
  assert((fw::core::add_months(fw::core::add_months(jan31_24, 1), 1) == Date{2024, 3, 29}));
  // en un seul saut, le 31 existe en mars
  assert((fw::core::add_months(jan31_23, 2) == Date{2023, 3, 31}));

  assert((fw::core::add_months(Date{2023, 12, 15}, 1) == Date{2024, 1, 15}));
  assert((fw::core::add_months(Date{2024, 3, 31}, -1) == Date{2024, 2, 29}));
  assert((fw::core::add_months(Date{2024, 1, 10}, -13) == Date{2022, 12, 10}));
  assert((fw::core::add_months(Date{2024, 5, 31}, 24) == Date{2026, 5, 31}));

  // 3) Ajout de jours
  assert((fw::core::add_days(Date{2024, 2, 28}, 1) == Date{2024, 2, 29}));
  assert((fw::core::add_days(Date{2024, 2, 28}, 2) == Date{2024, 3, 1}));
  assert((fw::core::add_days(Date{2023, 2, 28}, 1) == Date{2023, 3, 1}));
  assert((fw::core::add_days(Date{2023, 12, 31}, 1) == Date{2024, 1, 1}));
  assert((fw::core::add_days(Date{2024, 1, 1}, -1) == Date{2023, 12, 31}));
  assert((fw::core::add_days(Date{2024, 1, 1}, 366) == Date{2025, 1, 1}));
  assert((fw::core::add_days(Date{1999, 12, 31}, 0) == Date{1999, 12, 31}));

  // 3b) Domaine des années : 1..9999
  auto throws_range = [](auto f) {
    try { f(); } catch (const std::out_of_range&) { return true; }
    return false;
  };
  assert(!fw::core::is_valid_date(0, 1, 1));
  assert(!fw::core::is_valid_date(10000, 1, 1));
  assert(fw::core::is_valid_date(9999, 12, 31));
  assert((fw::core::add_months(Date{9999, 11, 30}, 1) == Date{9999, 12, 30}));
  assert(throws_range([]{ fw::core::add_months(Date{9999, 12, 1}, 1); }));
  assert(throws_range([]{ fw::core::add_days(Date{9999, 12, 31}, 1); }));
  assert(throws_range([]{ fw::core::add_days(Date{1, 1, 1}, -1); }));
  assert(throws_invalid([]{ fw::core::parse_iso_date("0000-01-01"); }));

  // 4) Libellés & ISO
  assert(fw::core::month_label(Date{2024, 2, 10}) == "February 2024");
  assert(fw::core::month_label(Date{2023, 12, 1}) == "December 2023");
  assert((fw::core::parse_iso_date("2024-01-31") == Date{2024, 1, 31}));
  assert(fw::core::to_iso_string(Date{2024, 3, 5}) == "2024-03-05");
  assert(throws_invalid([]{ fw::core::parse_iso_date("2023-02-29"); }));
  assert(throws_invalid([]{ fw::core::parse_iso_date("2024/01/31"); }));
  assert(throws_invalid([]{ fw::core::parse_iso_date("24-1-31"); }));
  assert(throws_invalid([]{ fw::core::make_date(2024, 4, 31); }));

  assert((Date{2024, 1, 31} < Date{2024, 2, 1}));
  assert(!(Date{2024, 2, 1} < Date{2024, 2, 1}));

  // 5) Arrondis monétaires (half-up) et formatage
  assert(fw::core::round_half_up_cents(2.345) == 2.35);
  assert(fw::core::round_half_up_cents(2.675) == 2.68);
  assert(fw::core::round_half_up_cents(1.005) == 1.01);
  assert(fw::core::round_half_up_cents(0.714) == 0.71);
  assert(fw::core::round_half_up_cents(0.0) == 0.0);
  assert(fw::core::round_half_up_cents(0.005) == 0.01);
  // juste sous la demi-valeur : pas de remontée
  assert(fw::core::round_half_up_cents(0.004999999999995) == 0.0);
  assert(fw::core::round_half_up_cents(1.234999999999995) == 1.23);
  assert(fw::core::round_half_up_cents(-2.675) == -2.68);

  assert(fw::core::format_amount(1234567.891) == "1,234,567.89");
  assert(fw::core::format_amount(0.0) == "0.00");
  assert(fw::core::format_amount(999.995) == "1,000.00");
  assert(fw::core::format_amount(100.0) == "100.00");
  assert(fw::core::format_amount(-1234.5) == "-1,234.50");
  assert(fw::core::format_currency(1000.0) == "KES 1,000.00");

  std::cout << "Calendar & money OK.\n";
  return 0;
}
