#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE engine
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "t_journal.h"

namespace {
  string failing_field(xact_builder_t& builder, const intent_t& intent)
  {
    try {
      builder.build_lines(intent);
    }
    catch (const validation_error& err) {
      return err.field;
    }
    return "";
  }

  expense_intent_t spend(const account_id_t account, const tag_id_t tag,
                         const fixed_t& amount)
  {
    expense_intent_t intent(account);
    intent.splits.push_back(split_t(tag, amount));
    return intent;
  }
}

struct builder_fixture : public journal_fixture {
  xact_builder_t builder;

  builder_fixture() : builder(journal) {}
};

BOOST_FIXTURE_TEST_SUITE(builder, builder_fixture)

BOOST_AUTO_TEST_CASE(testSimpleExpense)
{
  lines_list lines(builder.build_lines(spend(cash, food, amt("12.50"))));

  BOOST_REQUIRE_EQUAL(1U, lines.size());
  BOOST_CHECK_EQUAL(cash, lines[0].account);
  BOOST_CHECK_EQUAL(food, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[0].sign);
  BOOST_CHECK_EQUAL(amt("12.50"), lines[0].amount);
  BOOST_CHECK_EQUAL(fixed_t(1L), lines[0].rate);
  BOOST_CHECK(! lines[0].is_common());
}

BOOST_AUTO_TEST_CASE(testSplitExpense)
{
  expense_intent_t intent(spend(cash, food, amt("30")));
  intent.splits.push_back(split_t(travel, amt("12.25")));

  lines_list lines(builder.build_lines(intent));
  BOOST_REQUIRE_EQUAL(2U, lines.size());
  BOOST_CHECK_EQUAL(food, lines[0].tag);
  BOOST_CHECK_EQUAL(travel, lines[1].tag);
  BOOST_CHECK_EQUAL(amt("12.25"), lines[1].amount);
  BOOST_CHECK_EQUAL(amt("42.25"), intent.base());
}

BOOST_AUTO_TEST_CASE(testIncome)
{
  lines_list lines(builder.build_lines
                   (income_intent_t(bank, fixed_t(2000L), salary)));

  BOOST_REQUIRE_EQUAL(1U, lines.size());
  BOOST_CHECK_EQUAL(bank, lines[0].account);
  BOOST_CHECK_EQUAL(salary, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[0].sign);
  BOOST_CHECK_EQUAL(fixed_t(2000L), lines[0].amount);
}

BOOST_AUTO_TEST_CASE(testIncomeNewCategory)
{
  income_intent_t intent(bank, fixed_t(50L));
  intent.new_category = new_category_t("Bonus", CATEGORY_INCOME);

  lines_list lines(builder.build_lines(intent));
  const tag_t * bonus = journal.tags().find("Bonus");

  BOOST_REQUIRE(bonus);
  BOOST_CHECK(journal.tags().is_income_category(bonus->id));
  BOOST_CHECK_EQUAL(bonus->id, lines[0].tag);

  // Building again reuses the same category
  std::size_t count = journal.tags().tags.size();
  BOOST_CHECK_EQUAL(bonus->id, builder.build_lines(intent)[0].tag);
  BOOST_CHECK_EQUAL(count, journal.tags().tags.size());

  intent.new_category = new_category_t(" ", CATEGORY_INCOME);
  BOOST_CHECK_EQUAL("new_category", failing_field(builder, intent));
}

BOOST_AUTO_TEST_CASE(testTransferWithFee)
{
  lines_list lines(builder.build_lines
                   (transfer_intent_t(bank, cash, fixed_t(100L),
                                      amt("1.50"))));

  BOOST_REQUIRE_EQUAL(3U, lines.size());
  BOOST_CHECK_EQUAL(bank, lines[0].account);
  BOOST_CHECK_EQUAL(TRANSFER_TAG, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[0].sign);
  BOOST_CHECK_EQUAL(cash, lines[1].account);
  BOOST_CHECK_EQUAL(TRANSFER_TAG, lines[1].tag);
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[1].sign);
  BOOST_CHECK_EQUAL(fixed_t(100L), lines[1].amount);

  BOOST_CHECK_EQUAL(bank, lines[2].account);
  BOOST_CHECK_EQUAL(FEE_TAG, lines[2].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[2].sign);
  BOOST_CHECK_EQUAL(amt("1.50"), lines[2].amount);
  BOOST_CHECK(lines[2].is_common());

  xact_t xact(builder.build(transfer_intent_t(bank, cash, fixed_t(100L),
                                              amt("1.50")),
                            on(2024, 1, 15)));
  journal.insert_xact(xact);
  BOOST_CHECK_EQUAL(amt("898.50"), balance(bank));
  BOOST_CHECK_EQUAL(fixed_t(200L), balance(cash));

  // A zero fee adds no line
  BOOST_CHECK_EQUAL(2U, builder.build_lines
                    (transfer_intent_t(bank, cash, fixed_t(1L),
                                       fixed_t())).size());
}

BOOST_AUTO_TEST_CASE(testExchange)
{
  lines_list lines(builder.build_lines
                   (exchange_intent_t(cash, euros, fixed_t(50L),
                                      fixed_t(45L))));

  BOOST_REQUIRE_EQUAL(2U, lines.size());
  BOOST_CHECK_EQUAL(cash, lines[0].account);
  BOOST_CHECK_EQUAL(EXCHANGE_TAG, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[0].sign);
  BOOST_CHECK_EQUAL(fixed_t(50L), lines[0].amount);
  BOOST_CHECK_EQUAL(fixed_t(1L), lines[0].rate);

  // The euro leg carries the realized rate, 50/45 dollars per euro
  BOOST_CHECK_EQUAL(euros, lines[1].account);
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[1].sign);
  BOOST_CHECK_EQUAL(fixed_t(45L), lines[1].amount);
  BOOST_CHECK_EQUAL(amt("1.111111111111111111"), lines[1].rate);

  // Leaving the reference currency prices the other side instead
  lines = builder.build_lines(exchange_intent_t(euros, cash, fixed_t(40L),
                                                fixed_t(50L), fixed_t(1L)));
  BOOST_REQUIRE_EQUAL(3U, lines.size());
  BOOST_CHECK_EQUAL(amt("1.25"), lines[0].rate);
  BOOST_CHECK_EQUAL(fixed_t(1L), lines[1].rate);
  BOOST_CHECK_EQUAL(euros, lines[2].account);
  BOOST_CHECK_EQUAL(amt("1.25"), lines[2].rate);
}

BOOST_AUTO_TEST_CASE(testMultiCurrencyExpense)
{
  expense_intent_t intent(spend(cash, food, amt("18.50")));
  intent.category_currency = eur;
  intent.paid_amount       = fixed_t(20L);

  lines_list lines(builder.build_lines(intent));
  const account_t& shadow(journal.find_or_create_shadow_account(personal, eur));

  BOOST_REQUIRE_EQUAL(3U, lines.size());
  BOOST_CHECK_EQUAL(cash, lines[0].account);
  BOOST_CHECK_EQUAL(EXCHANGE_TAG, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[0].sign);
  BOOST_CHECK_EQUAL(fixed_t(20L), lines[0].amount);

  BOOST_CHECK_EQUAL(shadow.id, lines[1].account);
  BOOST_CHECK_EQUAL(EXCHANGE_TAG, lines[1].tag);
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[1].sign);
  BOOST_CHECK_EQUAL(amt("18.50"), lines[1].amount);
  BOOST_CHECK_EQUAL(amt("1.081081081081081081"), lines[1].rate);

  BOOST_CHECK_EQUAL(shadow.id, lines[2].account);
  BOOST_CHECK_EQUAL(food, lines[2].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[2].sign);
  BOOST_CHECK_EQUAL(amt("18.50"), lines[2].amount);
  BOOST_CHECK_EQUAL(lines[1].rate, lines[2].rate);

  // The shadow account nets to zero once written
  xact_t xact(builder.build(intent, on(2024, 2, 3)));
  journal.insert_xact(xact);
  BOOST_CHECK_EQUAL(fixed_t(80L), balance(cash));
  BOOST_CHECK(balance(shadow.id).is_zero());
  BOOST_CHECK(journal.valid());
}

BOOST_AUTO_TEST_CASE(testMultiCurrencyIntoReference)
{
  expense_intent_t intent(spend(euros, food, fixed_t(10L)));
  intent.category_currency = usd;
  intent.paid_amount       = fixed_t(8L);

  lines_list lines(builder.build_lines(intent));
  BOOST_REQUIRE_EQUAL(3U, lines.size());
  BOOST_CHECK_EQUAL(amt("1.25"), lines[0].rate);
  BOOST_CHECK_EQUAL(fixed_t(1L), lines[1].rate);
  BOOST_CHECK(journal.get_account(lines[1].account).is_shadow());
  BOOST_CHECK_EQUAL(usd, journal.get_account(lines[1].account).currency);

  // The paid amount is ignored without a second currency
  expense_intent_t single(spend(cash, food, fixed_t(10L)));
  single.paid_amount = fixed_t(99L);
  BOOST_CHECK_EQUAL(1U, builder.build_lines(single).size());
}

BOOST_AUTO_TEST_CASE(testPercentageAddon)
{
  expense_intent_t intent(spend(cash, food, fixed_t(40L)));
  intent.addons.push_back(addon_t::percentage(tips(), amt("0.15")));

  lines_list lines(builder.build_lines(intent));
  BOOST_REQUIRE_EQUAL(2U, lines.size());
  BOOST_CHECK_EQUAL(tips(), lines[1].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[1].sign);
  BOOST_CHECK_EQUAL(amt("6.00"), lines[1].amount);
  BOOST_CHECK(lines[1].is_common());
  BOOST_REQUIRE(lines[1].pct_value);
  BOOST_CHECK_EQUAL(amt("0.15"), *lines[1].pct_value);
}

BOOST_AUTO_TEST_CASE(testAddonRounding)
{
  expense_intent_t intent(spend(cash, food, amt("12.34")));
  intent.addons.push_back(addon_t::percentage(tips(), amt("0.125")));

  BOOST_CHECK_EQUAL(amt("1.54"), builder.build_lines(intent)[1].amount);

  xact_builder_t exact(journal, false);
  BOOST_CHECK_EQUAL(amt("1.5425"), exact.build_lines(intent)[1].amount);
  BOOST_CHECK_EQUAL(amt("1.5425"),
                    exact.addon_amount(amt("12.34"), amt("0.125"),
                                       journal.get_currency(usd)));
}

BOOST_AUTO_TEST_CASE(testDiscountAndAbsoluteAddons)
{
  expense_intent_t intent(spend(cash, food, fixed_t(40L)));
  intent.addons.push_back(addon_t::absolute(DISCOUNT_TAG, fixed_t(5L)));
  intent.addons.push_back(addon_t::absolute(FEE_TAG, amt("0.75")));
  intent.addons.push_back(addon_t(tips()));

  lines_list lines(builder.build_lines(intent));

  // The empty tip produces no line
  BOOST_REQUIRE_EQUAL(3U, lines.size());
  BOOST_CHECK_EQUAL(DISCOUNT_TAG, lines[1].tag);
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[1].sign);
  BOOST_CHECK(! lines[1].pct_value);
  BOOST_CHECK_EQUAL(FEE_TAG, lines[2].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[2].sign);

  xact_t xact(builder.build(intent, on(2024, 1, 9)));
  journal.insert_xact(xact);
  BOOST_CHECK_EQUAL(amt("64.25"), balance(cash));
}

BOOST_AUTO_TEST_CASE(testAdjustment)
{
  adjustment_intent_t up(adjustment_to(journal, cash, fixed_t(120L)));
  BOOST_CHECK_EQUAL(fixed_t(20L), up.delta);
  BOOST_CHECK_EQUAL(ADJUSTMENT_TAG, up.kind);

  lines_list lines(builder.build_lines(up));
  BOOST_REQUIRE_EQUAL(1U, lines.size());
  BOOST_CHECK_EQUAL(SIGN_PLUS, lines[0].sign);
  BOOST_CHECK_EQUAL(fixed_t(20L), lines[0].amount);

  adjustment_intent_t down(adjustment_to(journal, cash, fixed_t(90L),
                                         INITIAL_TAG));
  lines = builder.build_lines(down);
  BOOST_CHECK_EQUAL(INITIAL_TAG, lines[0].tag);
  BOOST_CHECK_EQUAL(SIGN_MINUS, lines[0].sign);
  BOOST_CHECK_EQUAL(fixed_t(10L), lines[0].amount);

  BOOST_CHECK_THROW(adjustment_to(journal, 99, fixed_t(1L)), validation_error);
}

BOOST_AUTO_TEST_CASE(testBuildHeader)
{
  xact_t first(builder.build(spend(cash, food, fixed_t(1L))));
  xact_t second(builder.build(spend(cash, food, fixed_t(1L)),
                              xact_header_t(moment(2024, 5, 1),
                                            string("lunch"), cafe)));

  // An unset timestamp means now
  BOOST_CHECK(! first.when.is_not_a_date_time());
  BOOST_CHECK_EQUAL(16U, first.id.length());
  BOOST_CHECK(first.id != second.id);

  BOOST_CHECK_EQUAL(moment(2024, 5, 1), second.when);
  BOOST_CHECK_EQUAL("lunch", *second.note);
  BOOST_CHECK_EQUAL(cafe, *second.counterparty);

  try {
    builder.build(spend(cash, food, fixed_t(1L)),
                  xact_header_t(moment(2024, 5, 1), none,
                                counterparty_id_t(99)));
    BOOST_FAIL("an unknown counterparty was accepted");
  }
  catch (const validation_error& err) {
    BOOST_CHECK_EQUAL("counterparty", err.field);
  }

  // Building writes nothing
  BOOST_CHECK(journal.xacts.empty());
  BOOST_CHECK_EQUAL(fixed_t(100L), balance(cash));
}

BOOST_AUTO_TEST_CASE(testValidation)
{
  BOOST_CHECK_EQUAL("splits", failing_field(builder, expense_intent_t(cash)));
  BOOST_CHECK_EQUAL("splits",
                    failing_field(builder, spend(cash, food, fixed_t())));
  BOOST_CHECK_EQUAL("splits",
                    failing_field(builder, spend(cash, TRANSFER_TAG,
                                                 fixed_t(1L))));
  BOOST_CHECK_EQUAL("splits",
                    failing_field(builder, spend(cash, tips(), fixed_t(1L))));
  BOOST_CHECK_EQUAL("account",
                    failing_field(builder, spend(0, food, fixed_t(1L))));
  BOOST_CHECK_EQUAL("account",
                    failing_field(builder, spend(99, food, fixed_t(1L))));

  expense_intent_t bad_addon(spend(cash, food, fixed_t(10L)));
  bad_addon.addons.push_back(addon_t::absolute(tips(), amt("-1")));
  BOOST_CHECK_EQUAL("addons", failing_field(builder, bad_addon));

  // Only common tags may carry add-ons
  const tag_id_t not_addons[] = { TRANSFER_TAG, EXCHANGE_TAG, INITIAL_TAG,
                                  ADJUSTMENT_TAG, travel };
  for (const tag_id_t tag : not_addons) {
    expense_intent_t odd(spend(cash, food, fixed_t(40L)));
    odd.addons.push_back(addon_t::absolute(tag, fixed_t(2L)));
    BOOST_CHECK_EQUAL("addons", failing_field(builder, odd));
  }

  expense_intent_t unpaid(spend(cash, food, fixed_t(10L)));
  unpaid.category_currency = eur;
  BOOST_CHECK_EQUAL("paid_amount", failing_field(builder, unpaid));

  unpaid.category_currency = 99;
  BOOST_CHECK_EQUAL("category_currency", failing_field(builder, unpaid));

  expense_intent_t discounted(spend(cash, food, fixed_t(5L)));
  discounted.category_currency = eur;
  discounted.paid_amount       = fixed_t(5L);
  discounted.addons.push_back(addon_t::absolute(DISCOUNT_TAG, fixed_t(10L)));
  BOOST_CHECK_EQUAL("addons", failing_field(builder, discounted));

  BOOST_CHECK_EQUAL("category",
                    failing_field(builder, income_intent_t(bank, fixed_t(1L))));
  BOOST_CHECK_EQUAL("category",
                    failing_field(builder, income_intent_t(bank, fixed_t(1L),
                                                           INCOME_TAG)));
  BOOST_CHECK_EQUAL("amount",
                    failing_field(builder, income_intent_t(bank, amt("-5"),
                                                           salary)));

  BOOST_CHECK_EQUAL("to", failing_field(builder,
                                        transfer_intent_t(cash, cash,
                                                          fixed_t(1L))));
  BOOST_CHECK_EQUAL("to", failing_field(builder,
                                        transfer_intent_t(cash, euros,
                                                          fixed_t(1L))));
  BOOST_CHECK_EQUAL("to", failing_field(builder,
                                        transfer_intent_t(cash, 0,
                                                          fixed_t(1L))));
  BOOST_CHECK_EQUAL("from", failing_field(builder,
                                          transfer_intent_t(0, cash,
                                                            fixed_t(1L))));
  BOOST_CHECK_EQUAL("fee", failing_field(builder,
                                         transfer_intent_t(bank, cash,
                                                           fixed_t(1L),
                                                           amt("-1"))));

  BOOST_CHECK_EQUAL("to", failing_field(builder,
                                        exchange_intent_t(cash, bank,
                                                          fixed_t(1L),
                                                          fixed_t(1L))));
  BOOST_CHECK_EQUAL("received", failing_field(builder,
                                              exchange_intent_t(cash, euros,
                                                                fixed_t(1L),
                                                                fixed_t())));

  BOOST_CHECK_EQUAL("delta", failing_field(builder,
                                           adjustment_intent_t(cash,
                                                               fixed_t())));
  BOOST_CHECK_EQUAL("kind", failing_field(builder,
                                          adjustment_intent_t(cash,
                                                              fixed_t(1L),
                                                              FEE_TAG)));

  // Failed builds leave no trace
  BOOST_CHECK(journal.xacts.empty());
  BOOST_CHECK_EQUAL(3U, journal.accounts.size());
}

BOOST_AUTO_TEST_SUITE_END()
