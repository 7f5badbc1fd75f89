#include <fw/core/calendar.hpp>
#include <fw/core/money.hpp>
#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/comparator.hpp>
#include <fw/io/fund_csv.hpp>

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <fstream>
#include <ctime>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " initial_capital monthly_contribution months withholding_tax"
            << " [--no-fees] [--start YYYY-MM-DD] [--funds FILE]"
            << " [--daily-rounding] [--csv FILE]\n";
}

// Date du jour, lue uniquement ici (le moteur reçoit la date en paramètre)
static fw::core::Date today() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  #ifdef _WIN32
    localtime_s(&tm, &now);
  #else
    tm = *std::localtime(&now);
  #endif
  return fw::core::Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

static std::string pct(double v, int prec) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(prec) << v << "%";
  return os.str();
}

static void print_parameters(const fw::config::ProjectionParams& p) {
  const auto end_date = fw::core::add_months(p.start_date, p.horizon_months);
  std::cout << "Investment Parameters:\n"
            << "Initial Capital: "      << fw::core::format_currency(p.initial_capital) << "\n"
            << "Monthly Contribution: " << fw::core::format_currency(p.monthly_contribution) << "\n"
            << "Investment Period: "    << p.horizon_months << " months\n"
            << "Start Date: "           << fw::core::month_label(p.start_date) << "\n"
            << "End Date: "             << fw::core::month_label(end_date) << "\n"
            << "Withholding Tax: "      << p.withholding_tax_percent << "%\n"
            << "Management Fees: "      << (p.apply_management_fee ? "Included" : "Excluded") << "\n"
            << "Daily Interest Rounding: "
            << (p.interest_rounding == fw::config::InterestRounding::DailyToCent ? "Cent" : "None") << "\n";
}

static void print_comparison(const fw::projection::ComparisonReport& rep) {
  std::cout << "\nFund Comparison:\n" << std::string(110, '-') << "\n";
  std::cout << std::left  << std::setw(35) << "Fund Name" << " "
            << std::right << std::setw(9)  << "Rate" << " "
            << std::setw(20) << "Final Balance" << " "
            << std::setw(15) << "Interest" << " "
            << std::setw(15) << "Net Return" << "\n";
  std::cout << std::string(110, '-') << "\n";

  for (const auto& rf : rep.ranked) {
    std::cout << std::left  << std::setw(35) << rf.fund.name << " "
              << std::right << std::setw(9)  << pct(rf.fund.annual_rate, 3) << " "
              << std::setw(20) << fw::core::format_currency(rf.result.final_balance) << " "
              << std::setw(15) << fw::core::format_currency(rf.result.total_interest) << " "
              << std::setw(15) << pct(rf.result.net_return_percent, 2) << "\n";
  }
}

static void print_best(const fw::projection::RankedFund& best,
                       const fw::config::ProjectionParams& p) {
  const auto& res = best.result;
  std::cout << "\nBest Performing Fund Details:\n" << std::string(50, '-') << "\n"
            << "Fund: " << best.fund.name << "\n"
            << "Annual Interest Rate: " << best.fund.annual_rate << "%\n";
  if (p.apply_management_fee) {
    std::cout << "Management Fee Rate: " << best.fund.annual_fee_rate << "%\n";
  }

  std::cout << "\nMonthly Balance Progression (Best Fund):\n" << std::string(50, '-') << "\n";
  for (const auto& pt : res.monthly_balances) {
    std::cout << pt.label << " (" << fw::core::days_in_month(pt.date) << " days): "
              << fw::core::format_currency(pt.balance) << "\n";
  }

  std::cout << "\nFinal Results:\n"
            << "Final Balance: " << fw::core::format_currency(res.final_balance) << "\n"
            << "Total Interest Earned: " << fw::core::format_currency(res.total_interest) << "\n";
  if (p.apply_management_fee) {
    std::cout << "Total Fees Paid: " << fw::core::format_currency(res.total_fees) << "\n";
  }
  std::cout << "Total Contribution: " << fw::core::format_currency(res.total_contributed) << "\n"
            << "Net Return: " << pct(res.net_return_percent, 2) << "\n";

  std::cout << "\nNotes:\n"
            << "- Interest is calculated daily and compounded monthly\n"
            << "- Returns are shown after " << p.withholding_tax_percent << "% withholding tax\n"
            << "- Past performance does not guarantee future returns\n";
  if (p.apply_management_fee) std::cout << "- Management fees are deducted monthly\n";
  std::cout << "- Calculations account for actual number of days in each month\n"
            << "- Bank holidays are not considered in the calculations\n";
}

int main(int argc, char** argv) {
  if (argc < 5) {
    print_usage(argv[0]);
    return 1;
  }

  double capital, contribution, tax;
  int months;
  try {
    capital      = std::stod(argv[1]);
    contribution = std::stod(argv[2]);
    months       = std::stoi(argv[3]);
    tax          = std::stod(argv[4]);
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  bool fees = true;
  bool daily_rounding = false;
  std::string start_str;
  std::string funds_file = "data/funds/funds.csv";
  std::string csv_file;

  for (int i = 5; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--no-fees") {
      fees = false;
    } else if (arg == "--daily-rounding") {
      daily_rounding = true;
    } else if (arg == "--start" && i + 1 < argc) {
      start_str = argv[++i];
    } else if (arg == "--funds" && i + 1 < argc) {
      funds_file = argv[++i];
    } else if (arg == "--csv" && i + 1 < argc) {
      csv_file = argv[++i];
    } else if (arg.rfind("--csv=", 0) == 0) {
      csv_file = arg.substr(6);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  try {
    const fw::core::Date start = start_str.empty() ? today() : fw::core::parse_iso_date(start_str);
    const auto rounding = daily_rounding ? fw::config::InterestRounding::DailyToCent
                                         : fw::config::InterestRounding::None;
    fw::config::ProjectionParams params(capital, contribution, months, tax, fees, start,
                                        rounding, /*keep_daily_series=*/false);

    std::vector<std::string> warnings;
    const auto funds = fw::io::load_fund_catalog(funds_file, &warnings);
    for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";

    std::cout << "\n" << std::string(80, '=') << "\n"
              << std::setw(53) << "Investment Analysis Results" << "\n"
              << std::string(80, '=') << "\n\n";
    print_parameters(params);

    std::cout << "\nCalculating returns for each fund...\n";
    const auto rep = fw::projection::compare(funds, params);

    if (!rep.excluded.empty()) {
      std::cout << "\nNote: The following funds require higher minimum investment:\n";
      for (const auto& ex : rep.excluded) {
        std::cout << "- " << ex.fund.name << ": "
                  << fw::core::format_currency(ex.fund.minimum_investment) << "\n";
      }
    }
    for (const auto& w : rep.warnings) {
      std::cerr << "[warn] " << w.reason << "\n";
    }

    print_comparison(rep);
    print_best(rep.ranked.front(), params);

    // Optionnel : progression mensuelle du meilleur fonds en CSV
    if (!csv_file.empty()) {
      std::ofstream ofs(csv_file);
      if (!ofs) {
        std::cerr << "Cannot open CSV file: " << csv_file << "\n";
        return 2;
      }
      ofs.setf(std::ios::fixed);
      ofs << std::setprecision(6);
      ofs << "month,date,days,opening,contribution,interest,fee,closing\n";
      for (const auto& p : rep.ranked.front().result.periods) {
        ofs << '"' << p.label << "\"," << fw::core::to_iso_string(p.first_date) << ','
            << p.days << ',' << p.opening_balance << ',' << p.contribution << ','
            << p.interest << ',' << p.fee << ',' << p.closing_balance << '\n';
      }
      std::cout << "monthly progression written to: " << csv_file << "\n";
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "Validation error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
