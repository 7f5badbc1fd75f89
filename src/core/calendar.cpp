#include <fw/core/calendar.hpp>

#include <cstdio>     // std::snprintf
#include <cstddef>    // std::size_t
#include <stdexcept>  // std::invalid_argument, std::out_of_range

namespace fw {
namespace core {

namespace {

const char* const MONTH_NAMES[12] = {
  "January", "February", "March",     "April",   "May",      "June",
  "July",    "August",   "September", "October", "November", "December"
};

// Nombre de jours depuis 1970-01-01 (algorithme "days_from_civil" de H. Hinnant).
long days_from_civil(int y, int m, int d) noexcept {
  y -= (m <= 2) ? 1 : 0;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = static_cast<long>(y) - era * 400;                  // [0, 399]
  const long mp  = (m + 9) % 12;                                      // mars = 0
  const long doy = (153 * mp + 2) / 5 + d - 1;                        // [0, 365]
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;             // [0, 146096]
  return era * 146097 + doe - 719468;
}

Date civil_from_days(long z) noexcept {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp  = (5 * doy + 2) / 153;
  const int  d   = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  const int  m   = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  const long y   = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return Date{ static_cast<int>(y), m, d };
}

// Lit exactement `width` chiffres à partir de s[pos].
bool read_digits(const std::string& s, std::size_t pos, std::size_t width, int& out) {
  if (pos + width > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

void check_year(long year, const char* who) {
  if (year < MIN_YEAR || year > MAX_YEAR) {
    throw std::out_of_range(std::string(who) + ": year " + std::to_string(year)
                            + " outside supported range [1, 9999]");
  }
}

} // namespace

bool operator==(const Date& a, const Date& b) noexcept {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) noexcept {
  return !(a == b);
}

bool operator<(const Date& a, const Date& b) noexcept {
  if (a.year  != b.year)  return a.year  < b.year;
  if (a.month != b.month) return a.month < b.month;
  return a.day < b.day;
}

bool is_leap_year(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
  static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    throw std::invalid_argument("days_in_month: month must be in [1,12]");
  }
  if (month == 2 && is_leap_year(year)) return 29;
  return DAYS[month - 1];
}

int days_in_month(const Date& d) {
  return days_in_month(d.year, d.month);
}

bool is_valid_date(int year, int month, int day) noexcept {
  if (year < MIN_YEAR || year > MAX_YEAR) return false;
  if (month < 1 || month > 12 || day < 1) return false;
  return day <= days_in_month(year, month);
}

Date make_date(int year, int month, int day) {
  if (!is_valid_date(year, month, day)) {
    throw std::invalid_argument("make_date: invalid calendar date");
  }
  return Date{year, month, day};
}

Date add_days(const Date& d, long n) {
  const Date out = civil_from_days(days_from_civil(d.year, d.month, d.day) + n);
  check_year(out.year, "add_days");
  return out;
}

Date add_months(const Date& d, int n) {
  // Mois zéro-indexé puis division euclidienne (n peut être négatif)
  const long total = static_cast<long>(d.year) * 12 + (d.month - 1) + n;
  long y = total / 12;
  long m0 = total % 12;
  if (m0 < 0) { m0 += 12; y -= 1; }
  check_year(y, "add_months");

  const int year  = static_cast<int>(y);
  const int month = static_cast<int>(m0) + 1;
  const int last  = days_in_month(year, month);
  return Date{year, month, d.day < last ? d.day : last};
}

std::string month_label(const Date& d) {
  if (d.month < 1 || d.month > 12) {
    throw std::invalid_argument("month_label: month must be in [1,12]");
  }
  return std::string(MONTH_NAMES[d.month - 1]) + " " + std::to_string(d.year);
}

Date parse_iso_date(const std::string& s) {
  int y = 0, m = 0, d = 0;
  const bool shape_ok = s.size() == 10 && s[4] == '-' && s[7] == '-'
                        && read_digits(s, 0, 4, y)
                        && read_digits(s, 5, 2, m)
                        && read_digits(s, 8, 2, d);
  if (!shape_ok) {
    throw std::invalid_argument("parse_iso_date: expected YYYY-MM-DD, got '" + s + "'");
  }
  if (!is_valid_date(y, m, d)) {
    throw std::invalid_argument("parse_iso_date: no such day '" + s + "'");
  }
  return Date{y, m, d};
}

std::string to_iso_string(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buf);
}

} // namespace core
} // namespace fw
