#include <fw/core/calendar.hpp>
#include <fw/core/money.hpp>
#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/projector.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <fstream>
#include <stdexcept>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " rate mgt_fee initial_capital monthly_contribution months withholding_tax start_date"
            << " [--name NAME] [--no-fees] [--daily-rounding] [--daily-csv FILE]\n";
}

int main(int argc, char** argv) {
  if (argc < 8) { usage(argv[0]); return 1; }

  // Positionnels
  double rate, fee, capital, contribution, tax; int months; std::string start_str;
  try {
    rate = std::stod(argv[1]); fee = std::stod(argv[2]);
    capital = std::stod(argv[3]); contribution = std::stod(argv[4]);
    months = std::stoi(argv[5]); tax = std::stod(argv[6]);
    start_str = argv[7];
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  // Flags
  std::string name = "Fund";
  bool fees = true, daily_rounding = false;
  std::string daily_csv;
  for (int i=8;i<argc;++i) {
    std::string a = argv[i];
    if (a=="--name" && i+1<argc) name = argv[++i];
    else if (a=="--no-fees") fees = false;
    else if (a=="--daily-rounding") daily_rounding = true;
    else if (a=="--daily-csv" && i+1<argc) daily_csv = argv[++i];
    else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
  }

  try {
    fw::market::Fund fund(name, rate, fee, /*minimum_investment=*/0.0);
    fw::config::ProjectionParams params(
        capital, contribution, months, tax, fees, fw::core::parse_iso_date(start_str),
        daily_rounding ? fw::config::InterestRounding::DailyToCent
                       : fw::config::InterestRounding::None,
        /*keep_daily_series=*/!daily_csv.empty());

    const auto outcome = fw::projection::project(fund, params);
    if (const auto* failure = std::get_if<fw::projection::CalculationFailure>(&outcome)) {
      std::cerr << "Error: " << failure->message() << "\n";
      return 3;
    }
    const auto& res = std::get<fw::projection::ProjectionResult>(outcome);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "fund          : " << res.fund_name << "\n"
              << "daily_rate    : " << rate / 365.0 / 100.0 << "\n"
              << "final_balance : " << res.final_balance << "\n"
              << "interest      : " << res.total_interest << "\n"
              << "fees          : " << res.total_fees << "\n"
              << "contributed   : " << res.total_contributed << "\n"
              << "net_return_%  : " << res.net_return_percent << "\n\n";

    std::cout << std::setprecision(2);
    for (const auto& p : res.periods) {
      std::cout << std::left << std::setw(16) << p.label << std::right
                << " days=" << p.days
                << " interest=" << std::setw(12) << p.interest
                << " fee=" << std::setw(8) << p.fee
                << " closing=" << fw::core::format_currency(p.closing_balance) << "\n";
    }

    if (!daily_csv.empty()) {
      std::ofstream ofs(daily_csv);
      if (!ofs) {
        std::cerr << "Cannot open CSV file: " << daily_csv << "\n";
        return 2;
      }
      ofs.setf(std::ios::fixed);
      ofs << std::setprecision(10);
      ofs << "date,balance,interest\n";
      for (const auto& d : res.daily) {
        ofs << fw::core::to_iso_string(d.date) << ',' << d.balance << ',' << d.interest << '\n';
      }
      std::cout << "daily series written to: " << daily_csv << " (" << res.daily.size() << " days)\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
