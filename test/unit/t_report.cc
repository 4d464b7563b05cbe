#define BOOST_TEST_DYN_LINK
//#define BOOST_TEST_MODULE report
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "t_journal.h"
#include "report.h"

/*
 * January: salary, a tipped lunch at the cafe, a transfer with a fee
 * and an exchange that prices the euro at 1.25.  February: groceries
 * paid in euros.
 */
struct report_fixture : public journal_fixture {
  report_fixture() {
    session.commit(income_intent_t(bank, fixed_t(2000L), salary),
                   on(2024, 1, 5));

    expense_intent_t lunch(cash);
    lunch.splits.push_back(split_t(food, fixed_t(40L)));
    lunch.addons.push_back(addon_t::percentage(tips(), amt("0.15")));
    session.commit(lunch, xact_header_t(moment(2024, 1, 10), none, cafe));

    session.commit(transfer_intent_t(bank, cash, fixed_t(100L), amt("1.50")),
                   on(2024, 1, 15));
    session.commit(exchange_intent_t(cash, euros, fixed_t(50L), fixed_t(40L)),
                   on(2024, 1, 20));

    expense_intent_t market(euros);
    market.splits.push_back(split_t(groceries, fixed_t(18L)));
    session.commit(market, on(2024, 2, 2));
  }

  summary_t january(const optional<currency_id_t>& currency = none) const {
    return summarize(journal, moment(2024, 1, 1, 0), moment(2024, 2, 1, 0),
                     currency);
  }
};

BOOST_FIXTURE_TEST_SUITE(report, report_fixture)

BOOST_AUTO_TEST_CASE(testBalances)
{
  BOOST_CHECK_EQUAL(fixed_t(104L), balance(cash));
  BOOST_CHECK_EQUAL(amt("2898.50"), balance(bank));
  BOOST_CHECK_EQUAL(fixed_t(222L), balance(euros));
  BOOST_CHECK_EQUAL(amt("1.25"), *journal.latest_rate(eur));
  BOOST_CHECK(journal.valid());
}

BOOST_AUTO_TEST_CASE(testSummarize)
{
  // Transfer and exchange legs are neither income nor expense
  summary_t jan(january());
  BOOST_CHECK_EQUAL(fixed_t(2000L), jan.income);
  BOOST_CHECK_EQUAL(amt("47.50"), jan.expense);
  BOOST_CHECK_EQUAL(amt("1952.50"), jan.net());
  BOOST_CHECK_EQUAL(4U, jan.count);

  // Euro lines are converted through their own rate snapshot
  summary_t feb(month_summary(journal, 2024, 2));
  BOOST_CHECK(feb.income.is_zero());
  BOOST_CHECK_EQUAL(amt("22.50"), feb.expense);
  BOOST_CHECK_EQUAL(1U, feb.count);

  summary_t none_at_all(month_summary(journal, 2023, 12));
  BOOST_CHECK(none_at_all.net().is_zero());
  BOOST_CHECK_EQUAL(0U, none_at_all.count);

  BOOST_CHECK_THROW(month_summary(journal, 2024, 13), validation_error);
}

BOOST_AUTO_TEST_CASE(testSummarizeOneCurrency)
{
  summary_t euro(summarize(journal, moment(2024, 1, 1, 0),
                           moment(2024, 3, 1, 0), eur));
  BOOST_CHECK_EQUAL(fixed_t(18L), euro.expense);
  BOOST_CHECK(euro.income.is_zero());
  BOOST_CHECK_EQUAL(2U, euro.count);

  summary_t dollars(january(usd));
  BOOST_CHECK_EQUAL(amt("47.50"), dollars.expense);
  BOOST_CHECK_EQUAL(4U, dollars.count);
}

BOOST_AUTO_TEST_CASE(testBalanceAt)
{
  BOOST_CHECK_EQUAL(fixed_t(100L), balance_at(journal, cash,
                                              moment(2024, 1, 10)));
  BOOST_CHECK_EQUAL(fixed_t(54L), balance_at(journal, cash,
                                             moment(2024, 1, 12, 0)));
  BOOST_CHECK_EQUAL(fixed_t(104L), balance_at(journal, cash,
                                              moment(2025, 1, 1)));
  BOOST_CHECK_EQUAL(fixed_t(1000L), balance_at(journal, bank,
                                               moment(2023, 1, 1)));
}

BOOST_AUTO_TEST_CASE(testDailySeries)
{
  daily_amounts_t net(daily_net(journal, cash, date_t(2024, 1, 1),
                                date_t(2024, 2, 1)));
  BOOST_CHECK_EQUAL(3U, net.size());
  BOOST_CHECK_EQUAL(fixed_t(-46L), net[date_t(2024, 1, 10)]);
  BOOST_CHECK_EQUAL(fixed_t(100L), net[date_t(2024, 1, 15)]);
  BOOST_CHECK_EQUAL(fixed_t(-50L), net[date_t(2024, 1, 20)]);

  fixed_t closing(balance_at(journal, cash, moment(2024, 1, 17, 0)));
  BOOST_CHECK_EQUAL(fixed_t(154L), closing);

  daily_amounts_t balances(daily_balances(journal, cash, date_t(2024, 1, 14),
                                          date_t(2024, 1, 17), closing));
  BOOST_CHECK_EQUAL(3U, balances.size());
  BOOST_CHECK_EQUAL(fixed_t(54L), balances[date_t(2024, 1, 14)]);
  BOOST_CHECK_EQUAL(fixed_t(154L), balances[date_t(2024, 1, 15)]);
  BOOST_CHECK_EQUAL(fixed_t(154L), balances[date_t(2024, 1, 16)]);
}

BOOST_AUTO_TEST_CASE(testTagRollup)
{
  tag_rollup_t rollup(tag_rollup(journal, moment(2024, 1, 1, 0),
                                 moment(2024, 3, 1, 0)));

  BOOST_CHECK_EQUAL(fixed_t(2000L), rollup[salary].income);
  BOOST_CHECK_EQUAL(fixed_t(40L), rollup[food].expense);
  BOOST_CHECK_EQUAL(fixed_t(6L), rollup[tips()].expense);
  BOOST_CHECK_EQUAL(amt("1.50"), rollup[FEE_TAG].expense);
  BOOST_CHECK_EQUAL(amt("22.50"), rollup[groceries].expense);
  BOOST_CHECK_EQUAL(1U, rollup[groceries].lines);
  BOOST_CHECK(! rollup.count(TRANSFER_TAG));
  BOOST_CHECK(! rollup.count(EXCHANGE_TAG));
}

BOOST_AUTO_TEST_CASE(testCounterpartyRollup)
{
  counterparty_rollup_t rollup(counterparty_rollup(journal,
                                                   moment(2024, 1, 1, 0),
                                                   moment(2024, 3, 1, 0)));
  BOOST_CHECK_EQUAL(1U, rollup.size());
  BOOST_CHECK_EQUAL(fixed_t(46L), rollup[cafe].expense);
  BOOST_CHECK_EQUAL(2U, rollup[cafe].lines);
  BOOST_CHECK_EQUAL(fixed_t(-46L), rollup[cafe].net());
}

BOOST_AUTO_TEST_CASE(testBudgetProgress)
{
  // Groceries count toward the food budget; tips do not
  budget_t& food_budget(journal.add_budget(food, date_t(2024, 1, 1),
                                           date_t(2024, 3, 1),
                                           fixed_t(100L)));
  budget_progress_t progress(budget_progress(journal, food_budget));

  BOOST_CHECK_EQUAL(amt("62.50"), progress.actual);
  BOOST_CHECK_EQUAL(amt("37.50"), progress.remaining);
  BOOST_CHECK_CLOSE(0.625, progress.ratio, 0.0001);
  BOOST_CHECK(! progress.over_budget());

  budget_t& tight(journal.add_budget(groceries, date_t(2024, 2, 1),
                                     date_t(2024, 2, 2), fixed_t(10L)));
  progress = budget_progress(journal, tight);
  BOOST_CHECK(progress.actual.is_zero());

  tight.end = date_t(2024, 3, 1);
  progress  = budget_progress(journal, tight);
  BOOST_CHECK_EQUAL(amt("22.50"), progress.actual);
  BOOST_CHECK_EQUAL(amt("-12.50"), progress.remaining);
  BOOST_CHECK(progress.over_budget());

  budget_t& empty(journal.add_budget(travel, date_t(2024, 1, 1),
                                     date_t(2024, 3, 1), fixed_t()));
  progress = budget_progress(journal, empty);
  BOOST_CHECK_EQUAL(0.0, progress.ratio);
}

BOOST_AUTO_TEST_SUITE_END()
