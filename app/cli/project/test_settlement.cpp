#include "fw/projection/accrual.hpp"
#include "fw/projection/settlement.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using fw::core::Date;
using fw::config::InterestRounding;
using fw::config::ProjectionParams;

int main() {
  const fw::market::Fund fund("My first example fund", 16.91, 0.85, 1000.0);
  constexpr double EPS = 1e-9;

  // 1) Intérêt journalier : positif, croissant en B et r, décroissant en t
  const double r = fw::projection::daily_rate(16.91);
  assert(r == 16.91 / 365.0 / 100.0);

  const std::vector<double> balances {1.0, 100.0, 1000.0, 1e6};
  const std::vector<double> rates    {0.01, 1.0, 16.91, 30.0};
  const std::vector<double> taxes    {0.0, 15.0, 50.0, 99.0};
  for (double B : balances)
    for (double a : rates)
      for (double t : taxes) {
        const double rd = fw::projection::daily_rate(a);
        const double i  = fw::projection::day_accrual(B, rd, t);
        assert(i > 0.0);
        assert(fw::projection::day_accrual(B * 2.0, rd, t) > i);
        assert(fw::projection::day_accrual(B, fw::projection::daily_rate(a * 1.5), t) > i);
        assert(fw::projection::day_accrual(B, rd, t + 1.0) < i);
      }
  assert(fw::projection::day_accrual(1000.0, r, 100.0) == 0.0);

  // 2) Frais : base = moyenne ouverture / clôture avant frais, arrondi au centime
  {
    const double fee = fw::projection::management_fee(1000.0, 1012.28, 0.85);
    assert(std::abs(fee - 0.71) < 1e-12);       // 1006.14 * 0.85 / 1200 = 0.71268…
    assert(fw::projection::management_fee(1000.0, 1000.0, 0.0) == 0.0);
    assert(std::abs(fw::projection::management_fee(12000.0, 12000.0, 1.0) - 10.0) < 1e-12);
  }

  // 3) Première période : pas de versement, 31 jours en janvier, trace cohérente
  {
    const ProjectionParams p(1000.0, 500.0, 1, 15.0, true, Date{2024, 1, 1});
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 1, 1}, 0, 1000.0);

    assert(res.label == "January 2024");
    assert(res.days == 31);
    assert(res.daily.size() == 31);
    assert(res.contribution == 0.0);
    assert((res.daily.front().date == Date{2024, 1, 1}));
    assert((res.daily.back().date  == Date{2024, 1, 31}));

    double sum = 0.0, prev = res.opening_balance;
    for (const auto& d : res.daily) {
      assert(d.balance >= prev);
      prev = d.balance;
      sum += d.interest;
    }
    assert(std::abs(sum - res.interest) < EPS);

    const double pre_fee = res.daily.back().balance;
    assert(res.fee == fw::projection::management_fee(1000.0, pre_fee, 0.85));
    assert(std::abs(res.closing_balance - (1000.0 + res.interest - res.fee)) < EPS);
    assert(res.closing_balance > 1000.0);
  }

  // 4) Période suivante : versement ajouté avant les intérêts, base des frais avant versement
  {
    const ProjectionParams p(1000.0, 500.0, 2, 15.0, true, Date{2024, 1, 1});
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 2, 1}, 1, 1011.57);

    assert(res.days == 29);
    assert(res.contribution == 500.0);
    const double first_expected = 1511.57 + fw::projection::day_accrual(1511.57, r, 15.0);
    assert(std::abs(res.daily.front().balance - first_expected) < EPS);

    const double pre_fee = res.daily.back().balance;
    assert(res.fee == fw::projection::management_fee(1011.57, pre_fee, 0.85));
    assert(std::abs(res.closing_balance - (1011.57 + 500.0 + res.interest - res.fee)) < EPS);
  }

  // 5) Février non bissextile, frais désactivés
  {
    const ProjectionParams p(1000.0, 0.0, 1, 0.0, false, Date{2023, 2, 1});
    const auto res = fw::projection::settle_period(fund, p, Date{2023, 2, 1}, 0, 1000.0);
    assert(res.days == 28);
    assert(res.fee == 0.0);
    // sans retenue ni frais : capitalisation journalière exacte
    const double closed_form = 1000.0 * std::pow(1.0 + r, 28);
    assert(std::abs(res.closing_balance - closed_form) < 1e-9 * closed_form);
  }

  // 6) Retenue à 100 % : aucun intérêt, solde inchangé
  {
    const ProjectionParams p(1000.0, 0.0, 1, 100.0, false, Date{2024, 1, 1});
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 1, 1}, 0, 1000.0);
    assert(res.interest == 0.0);
    assert(res.closing_balance == 1000.0);
  }

  // 7) Départ en milieu de mois : longueur du mois calendaire, dates glissantes
  {
    const ProjectionParams p(1000.0, 0.0, 1, 15.0, true, Date{2024, 1, 15});
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 1, 15}, 0, 1000.0);
    assert(res.days == 31);
    assert((res.daily.back().date == Date{2024, 2, 14}));
  }

  // 8) Politique d’arrondi journalier au centime
  {
    const ProjectionParams p(1000.0, 0.0, 1, 15.0, true, Date{2024, 1, 1},
                             InterestRounding::DailyToCent);
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 1, 1}, 0, 1000.0);
    for (const auto& d : res.daily) {
      const double cents = d.interest * 100.0;
      assert(std::abs(cents - std::round(cents)) < 1e-6);
    }
    const ProjectionParams q(1000.0, 0.0, 1, 15.0, true, Date{2024, 1, 1});
    const auto exact = fw::projection::settle_period(fund, q, Date{2024, 1, 1}, 0, 1000.0);
    // au plus un demi-centime par jour (hors capitalisation de l’écart)
    assert(std::abs(res.closing_balance - exact.closing_balance) < 0.16);
  }

  // 9) Contrôles de période : finitude et invariant de clôture
  {
    const ProjectionParams p(1000.0, 0.0, 1, 15.0, true, Date{2024, 1, 1});
    const auto res = fw::projection::settle_period(fund, p, Date{2024, 1, 1}, 0, 1000.0);
    assert(fw::projection::is_finite(res));
    assert(fw::projection::is_consistent(res));

    fw::projection::PeriodResult broken{};
    broken.opening_balance = 1000.0;
    broken.contribution    = 100.0;
    broken.interest        = 10.0;
    broken.fee             = 1.0;
    broken.closing_balance = 1109.0;
    assert(fw::projection::is_consistent(broken));
    broken.closing_balance = 1109.5;                  // 0.50 non expliqué
    assert(!fw::projection::is_consistent(broken));
    assert(fw::projection::is_consistent(broken, 1e-3));
    assert(fw::projection::is_finite(broken));

    broken.interest = std::nan("");
    assert(!fw::projection::is_finite(broken));
  }

  std::cout << "Settlement OK.\n";
  return 0;
}
