#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE data
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "tag.h"

using namespace tally;

struct tag_fixture {
  tag_pool_t pool;

  tag_fixture() {
    _log_level = LOG_WARN;
  }
};

BOOST_FIXTURE_TEST_SUITE(tag, tag_fixture)

BOOST_AUTO_TEST_CASE(testSystemTags)
{
  BOOST_CHECK_EQUAL("System", pool.find(SYSTEM_TAG)->name);
  BOOST_CHECK_EQUAL("Transfer", pool.find(TRANSFER_TAG)->name);
  BOOST_CHECK_EQUAL("Adjustment", pool.find(ADJUSTMENT_TAG)->name);

  BOOST_CHECK(pool.find(INCOME_TAG)->has_parent(SYSTEM_TAG));
  BOOST_CHECK(pool.find(EXCHANGE_TAG)->has_flags(TAG_PROTECTED));

  // Fee and discount are add-ons that hang under Expense
  BOOST_CHECK(pool.is_common(FEE_TAG));
  BOOST_CHECK(pool.is_common(DISCOUNT_TAG));
  BOOST_CHECK(pool.find(FEE_TAG)->has_parent(EXPENSE_TAG));
  BOOST_CHECK(! pool.is_common(TRANSFER_TAG));

  BOOST_CHECK(is_system_tag(SYSTEM_TAG));
  BOOST_CHECK(is_system_tag(ADJUSTMENT_TAG));
  BOOST_CHECK(! is_system_tag(0));
  BOOST_CHECK(! is_system_tag(last_system_tag + 1));

  BOOST_CHECK(pool.valid());
}

BOOST_AUTO_TEST_CASE(testSeededAddons)
{
  const tag_t * tips = pool.find("Tips");
  const tag_t * vat  = pool.find("vat");

  BOOST_REQUIRE(tips);
  BOOST_REQUIRE(vat);
  BOOST_CHECK_EQUAL(last_system_tag + 1, tips->id);
  BOOST_CHECK_EQUAL(last_system_tag + 2, vat->id);
  BOOST_CHECK(tips->is_common());
  BOOST_CHECK(vat->has_flags(TAG_PROTECTED));
  BOOST_CHECK(! is_system_tag(tips->id));

  // Add-ons are never offered as categories
  BOOST_CHECK(pool.categories(CATEGORY_EXPENSE).empty());
}

BOOST_AUTO_TEST_CASE(testCreate)
{
  tag_t& food = pool.create("Food", tag_pool_t::parents_for(CATEGORY_EXPENSE));

  BOOST_CHECK_EQUAL(last_system_tag + 3, food.id);
  BOOST_CHECK(pool.is_expense_category(food.id));
  BOOST_CHECK(! pool.is_income_category(food.id));
  BOOST_CHECK_EQUAL(food.id, pool.find("FOOD")->id);

  BOOST_CHECK_THROW(pool.create("food", tag_ids_set()), validation_error);
  BOOST_CHECK_THROW(pool.create("  ", tag_ids_set()), validation_error);

  tag_ids_set unknown;
  unknown.insert(999);
  BOOST_CHECK_THROW(pool.create("Orphan", unknown), validation_error);

  try {
    pool.create("", tag_ids_set());
    BOOST_FAIL("an empty name was accepted");
  }
  catch (const validation_error& err) {
    BOOST_CHECK_EQUAL("name", err.field);
  }

  BOOST_CHECK(pool.valid());
}

BOOST_AUTO_TEST_CASE(testFindOrCreate)
{
  tag_t& salary = pool.find_or_create("Salary", CATEGORY_INCOME);
  tag_t& again  = pool.find_or_create(" salary ", CATEGORY_EXPENSE);

  BOOST_CHECK_EQUAL(salary.id, again.id);
  BOOST_CHECK(pool.is_income_category(salary.id));
  BOOST_CHECK(! pool.is_expense_category(salary.id));

  tag_t& refund = pool.find_or_create("Refund", CATEGORY_BOTH);
  BOOST_CHECK(pool.is_income_category(refund.id));
  BOOST_CHECK(pool.is_expense_category(refund.id));

  std::vector<tag_id_t> both(pool.categories(CATEGORY_BOTH));
  BOOST_CHECK_EQUAL(1U, both.size());
  BOOST_CHECK_EQUAL(refund.id, both.front());

  std::vector<tag_id_t> income(pool.categories(CATEGORY_INCOME));
  BOOST_CHECK_EQUAL(2U, income.size());
  BOOST_CHECK_EQUAL(salary.id, income.front());
}

BOOST_AUTO_TEST_CASE(testHierarchy)
{
  tag_id_t food = pool.create("Food",
                              tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;

  tag_ids_set under_food;
  under_food.insert(food);
  tag_id_t groceries = pool.create("Groceries", under_food).id;

  tag_ids_set under_groceries;
  under_groceries.insert(groceries);
  tag_id_t fruit = pool.create("Fruit", under_groceries).id;

  BOOST_CHECK(pool.has_ancestor(fruit, food));
  BOOST_CHECK(pool.has_ancestor(fruit, EXPENSE_TAG));
  BOOST_CHECK(! pool.has_ancestor(food, fruit));
  BOOST_CHECK(! pool.has_ancestor(food, food));
  BOOST_CHECK(pool.is_expense_category(fruit));

  tag_ids_set family(pool.with_descendants(food));
  BOOST_CHECK_EQUAL(3U, family.size());
  BOOST_CHECK(family.count(food));
  BOOST_CHECK(family.count(groceries));
  BOOST_CHECK(family.count(fruit));

  BOOST_CHECK_EQUAL(1U, pool.with_descendants(fruit).size());

  // A tag may have several parents
  tag_id_t travel = pool.create("Travel",
                                tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;
  pool.add_parent(fruit, travel);
  BOOST_CHECK(pool.has_ancestor(fruit, travel));
  BOOST_CHECK(pool.with_descendants(travel).count(fruit));

  BOOST_CHECK(pool.valid());
}

BOOST_AUTO_TEST_CASE(testCycles)
{
  tag_id_t food = pool.create("Food",
                              tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;
  tag_ids_set under_food;
  under_food.insert(food);
  tag_id_t groceries = pool.create("Groceries", under_food).id;

  BOOST_CHECK_THROW(pool.add_parent(food, groceries), validation_error);
  BOOST_CHECK_THROW(pool.add_parent(food, food), validation_error);
  BOOST_CHECK_THROW(pool.add_parent(food, 999), validation_error);
  BOOST_CHECK_THROW(pool.add_parent(999, food), store_error);

  BOOST_CHECK(! pool.find(food)->has_parent(groceries));
  BOOST_CHECK(pool.valid());
}

BOOST_AUTO_TEST_CASE(testRenameAndRemove)
{
  tag_id_t food = pool.create("Food",
                              tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;
  tag_ids_set under_food;
  under_food.insert(food);
  tag_id_t groceries = pool.create("Groceries", under_food).id;

  pool.rename(food, "Meals");
  BOOST_CHECK_EQUAL("Meals", pool.find(food)->name);
  BOOST_CHECK(! pool.find("Food"));

  BOOST_CHECK_THROW(pool.rename(TRANSFER_TAG, "Moves"), validation_error);
  BOOST_CHECK_THROW(pool.rename(food, "Groceries"), validation_error);
  BOOST_CHECK_THROW(pool.rename(food, ""), validation_error);

  BOOST_CHECK_THROW(pool.remove(EXPENSE_TAG), validation_error);
  BOOST_CHECK_THROW(pool.remove(pool.find("Tips")->id), validation_error);
  BOOST_CHECK_THROW(pool.remove(999), store_error);

  // Removing a tag detaches its children
  pool.remove(food);
  BOOST_CHECK(! pool.find(food));
  BOOST_CHECK(pool.find(groceries)->parents.empty());
  BOOST_CHECK(! pool.is_expense_category(groceries));

  BOOST_CHECK(pool.valid());
}

BOOST_AUTO_TEST_SUITE_END()
