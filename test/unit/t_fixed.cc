#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE math
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "fixed.h"

using namespace tally;

struct fixed_fixture {
  fixed_fixture() {
    _log_level = LOG_WARN;
  }
};

BOOST_FIXTURE_TEST_SUITE(fixed, fixed_fixture)

BOOST_AUTO_TEST_CASE(testParser)
{
  fixed_t x0;
  fixed_t x1 = fixed_t::exact("12.50");
  fixed_t x2 = fixed_t::exact("-0.75");
  fixed_t x3 = fixed_t::exact("1e-3");
  fixed_t x4 = fixed_t::exact("1.5e2");
  fixed_t x5 = fixed_t::exact("+3");
  fixed_t x6 = fixed_t::exact(" 7 ");

  BOOST_CHECK_EQUAL(0, x0.int_part);
  BOOST_CHECK_EQUAL(0, x0.frac);

  BOOST_CHECK_EQUAL(12, x1.int_part);
  BOOST_CHECK_EQUAL(500000000000000000LL, x1.frac);

  // Negative values keep the fraction non-negative: -0.75 is -1 + 0.25
  BOOST_CHECK_EQUAL(-1, x2.int_part);
  BOOST_CHECK_EQUAL(250000000000000000LL, x2.frac);

  BOOST_CHECK_EQUAL(0, x3.int_part);
  BOOST_CHECK_EQUAL(1000000000000000LL, x3.frac);

  BOOST_CHECK_EQUAL(x4, fixed_t(150L));
  BOOST_CHECK_EQUAL(x5, fixed_t(3L));
  BOOST_CHECK_EQUAL(x6, fixed_t(7L));

  BOOST_CHECK_EQUAL(fixed_t::exact("0.000000000000000001").frac, 1);

  BOOST_CHECK_THROW(fixed_t::exact(""), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("abc"), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("1.2.3"), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("12 EUR"), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("1e"), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("1e999"), amount_error);

  // More than 18 fractional digits cannot be represented exactly
  BOOST_CHECK_THROW(fixed_t::exact("0.0000000000000000001"), amount_error);
  BOOST_CHECK_THROW(fixed_t::exact("1e-19"), amount_error);

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x2.valid());
  BOOST_CHECK(x3.valid());
}

BOOST_AUTO_TEST_CASE(testConstructors)
{
  fixed_t x1(5L);
  fixed_t x2(-5L);
  fixed_t x3(2, 250000000000000000LL);

  BOOST_CHECK_EQUAL(x1, fixed_t::exact("5"));
  BOOST_CHECK_EQUAL(x2, fixed_t::exact("-5"));
  BOOST_CHECK_EQUAL(x3, fixed_t::exact("2.25"));

  BOOST_CHECK_THROW(fixed_t(1, fixed_t::scale), amount_error);
  BOOST_CHECK_THROW(fixed_t(1, -1), amount_error);

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x2.valid());
  BOOST_CHECK(x3.valid());
}

BOOST_AUTO_TEST_CASE(testFromDouble)
{
  // A double is read through its 15 significant digits
  BOOST_CHECK_EQUAL(fixed_t::from_double(0.1), fixed_t::exact("0.1"));
  BOOST_CHECK_EQUAL(fixed_t::from_double(0.1) + fixed_t::from_double(0.2),
                    fixed_t::exact("0.3"));
  BOOST_CHECK_EQUAL(fixed_t::from_double(-12.5), fixed_t::exact("-12.5"));
  BOOST_CHECK_EQUAL(fixed_t::from_double(1e-7), fixed_t::exact("0.0000001"));
  BOOST_CHECK_EQUAL(fixed_t::from_double(0.0), fixed_t());

  BOOST_CHECK_THROW(fixed_t::from_double(std::numeric_limits<double>::quiet_NaN()),
                    amount_error);
  BOOST_CHECK_THROW(fixed_t::from_double(std::numeric_limits<double>::infinity()),
                    amount_error);
  BOOST_CHECK_THROW(fixed_t::from_double(1e20), amount_error);
}

BOOST_AUTO_TEST_CASE(testToDouble)
{
  const double values[] = { 0.1, 12.5, -0.75, 1234.5678, -99999.99 };

  for (double value : values) {
    double back = fixed_t::from_double(value).to_double();
    BOOST_CHECK(std::fabs(back - value) <= std::fabs(value) * 1e-15);
  }
  BOOST_CHECK_EQUAL(fixed_t().to_double(), 0.0);
}

BOOST_AUTO_TEST_CASE(testComparisons)
{
  fixed_t x1 = fixed_t::exact("-0.5");
  fixed_t x2 = fixed_t::exact("0.5");
  fixed_t x3 = fixed_t::exact("1.0");
  fixed_t x4 = fixed_t::exact("-1.5");

  BOOST_CHECK(x1 < x2);
  BOOST_CHECK(x4 < x1);
  BOOST_CHECK(x2 < x3);
  BOOST_CHECK(x3 > x2);
  BOOST_CHECK(x1 <= x1);
  BOOST_CHECK(x1 != x2);

  BOOST_CHECK(x1 < 0L);
  BOOST_CHECK(x2 > 0L);
  BOOST_CHECK(! (x1 > 0L));
  BOOST_CHECK(x3 == 1L);
  BOOST_CHECK(x4 < -1L);

  BOOST_CHECK_EQUAL(-1, x1.compare(x2));
  BOOST_CHECK_EQUAL(1, x2.compare(x1));
  BOOST_CHECK_EQUAL(0, x2.compare(fixed_t::exact("0.50")));
}

BOOST_AUTO_TEST_CASE(testAddition)
{
  // Fractions that overflow one whole unit carry into the integer part
  fixed_t x1 = fixed_t::exact("0.6") + fixed_t::exact("0.7");
  BOOST_CHECK_EQUAL(x1, fixed_t::exact("1.3"));
  BOOST_CHECK_EQUAL(1, x1.int_part);

  fixed_t x2 = fixed_t::exact("-0.25") + fixed_t::exact("0.25");
  BOOST_CHECK(x2.is_zero());

  fixed_t x3 = fixed_t::exact("-1.75") + fixed_t::exact("-2.5");
  BOOST_CHECK_EQUAL(x3, fixed_t::exact("-4.25"));

  fixed_t x4(10L);
  x4 += 5L;
  BOOST_CHECK_EQUAL(x4, fixed_t(15L));

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x3.valid());
}

BOOST_AUTO_TEST_CASE(testSubtraction)
{
  // A negative fraction borrows from the integer part
  fixed_t x1 = fixed_t::exact("1.2") - fixed_t::exact("0.5");
  BOOST_CHECK_EQUAL(x1, fixed_t::exact("0.7"));

  fixed_t x2 = fixed_t() - fixed_t::exact("0.25");
  BOOST_CHECK_EQUAL(-1, x2.int_part);
  BOOST_CHECK_EQUAL(750000000000000000LL, x2.frac);
  BOOST_CHECK_EQUAL(x2, fixed_t::exact("-0.25"));

  fixed_t x3 = fixed_t::exact("100") - fixed_t::exact("101.50");
  BOOST_CHECK_EQUAL(x3, fixed_t::exact("-1.5"));

  BOOST_CHECK(x2.valid());
  BOOST_CHECK(x3.valid());
}

BOOST_AUTO_TEST_CASE(testMultiplication)
{
  BOOST_CHECK_EQUAL(fixed_t::exact("40") * fixed_t::exact("0.15"),
                    fixed_t::exact("6"));
  BOOST_CHECK_EQUAL(fixed_t::exact("12.5") * fixed_t::exact("0.15"),
                    fixed_t::exact("1.875"));
  BOOST_CHECK_EQUAL(fixed_t::exact("-2.5") * fixed_t::exact("4"),
                    fixed_t::exact("-10"));
  BOOST_CHECK_EQUAL(fixed_t::exact("-0.5") * fixed_t::exact("-0.5"),
                    fixed_t::exact("0.25"));
  BOOST_CHECK_EQUAL(fixed_t::exact("2.5") * 2L, fixed_t(5L));

  // The product of two 18-digit fractions rounds half away from zero
  BOOST_CHECK_EQUAL(fixed_t::exact("0.000000000000000005") *
                    fixed_t::exact("0.1"),
                    fixed_t::exact("0.000000000000000001"));
  BOOST_CHECK_EQUAL(fixed_t::exact("-0.000000000000000005") *
                    fixed_t::exact("0.1"),
                    fixed_t::exact("-0.000000000000000001"));
}

BOOST_AUTO_TEST_CASE(testDivision)
{
  BOOST_CHECK_EQUAL(fixed_t(1L) / fixed_t(3L),
                    fixed_t::exact("0.333333333333333333"));
  BOOST_CHECK_EQUAL(fixed_t(2L) / fixed_t(3L),
                    fixed_t::exact("0.666666666666666667"));
  BOOST_CHECK_EQUAL(fixed_t(-2L) / fixed_t(3L),
                    fixed_t::exact("-0.666666666666666667"));
  BOOST_CHECK_EQUAL(fixed_t::exact("45") / fixed_t::exact("-50"),
                    fixed_t::exact("-0.9"));
  BOOST_CHECK_EQUAL(fixed_t::exact("20") / fixed_t::exact("18.50"),
                    fixed_t::exact("1.081081081081081081"));

  BOOST_CHECK_THROW(fixed_t(1L) / fixed_t(), amount_error);
  BOOST_CHECK_THROW(fixed_t().divide(fixed_t()), amount_error);
}

BOOST_AUTO_TEST_CASE(testRound)
{
  BOOST_CHECK_EQUAL(fixed_t::exact("1.005").round(2), fixed_t::exact("1.01"));
  BOOST_CHECK_EQUAL(fixed_t::exact("-1.005").round(2), fixed_t::exact("-1.01"));
  BOOST_CHECK_EQUAL(fixed_t::exact("2.344").round(2), fixed_t::exact("2.34"));
  BOOST_CHECK_EQUAL(fixed_t::exact("2.5").round(0), fixed_t(3L));
  BOOST_CHECK_EQUAL(fixed_t::exact("-2.5").round(0), fixed_t(-3L));
  BOOST_CHECK_EQUAL(fixed_t::exact("7.125").round(18),
                    fixed_t::exact("7.125"));

  BOOST_CHECK_EQUAL(0, int(fixed_t(3L).precision()));
  BOOST_CHECK_EQUAL(1, int(fixed_t::exact("12.50").precision()));
  BOOST_CHECK_EQUAL(3, int(fixed_t::exact("-0.125").precision()));
  BOOST_CHECK_EQUAL(18, int(fixed_t::exact("0.000000000000000001").precision()));
}

BOOST_AUTO_TEST_CASE(testUnary)
{
  fixed_t x1 = fixed_t::exact("3.25");
  fixed_t x2 = fixed_t::exact("-3.25");

  BOOST_CHECK_EQUAL(-x1, x2);
  BOOST_CHECK_EQUAL(x2.negated(), x1);
  BOOST_CHECK_EQUAL(x2.abs(), x1);
  BOOST_CHECK_EQUAL(x1.abs(), x1);
  BOOST_CHECK_EQUAL(-fixed_t(4L), fixed_t(-4L));

  BOOST_CHECK_EQUAL(1, x1.sign());
  BOOST_CHECK_EQUAL(-1, x2.sign());
  BOOST_CHECK_EQUAL(0, fixed_t().sign());
  BOOST_CHECK(fixed_t().is_zero());
  BOOST_CHECK(x2.is_nonzero());
}

BOOST_AUTO_TEST_CASE(testLegacy)
{
  BOOST_CHECK_EQUAL(fixed_t::from_legacy(1250, 2), fixed_t::exact("12.5"));
  BOOST_CHECK_EQUAL(fixed_t::from_legacy(-75, 2), fixed_t::exact("-0.75"));
  BOOST_CHECK_EQUAL(fixed_t::from_legacy(42, 0), fixed_t(42L));

  BOOST_CHECK_EQUAL(1235, fixed_t::exact("12.345").to_legacy(2));
  BOOST_CHECK_EQUAL(-1235, fixed_t::exact("-12.345").to_legacy(2));
  BOOST_CHECK_EQUAL(1250, fixed_t::exact("12.5").to_legacy(2));

  BOOST_CHECK_THROW(fixed_t::from_legacy(1, 19), amount_error);
  BOOST_CHECK_THROW(fixed_t(1L).to_legacy(19), amount_error);
}

BOOST_AUTO_TEST_CASE(testPrinting)
{
  BOOST_CHECK_EQUAL("0", fixed_t().to_string());
  BOOST_CHECK_EQUAL("12.5", fixed_t::exact("12.50").to_string());
  BOOST_CHECK_EQUAL("12.50", fixed_t::exact("12.5").to_string(2));
  BOOST_CHECK_EQUAL("-0.75", fixed_t::exact("-0.75").to_string());
  BOOST_CHECK_EQUAL("-3", fixed_t(-3L).to_string());
  BOOST_CHECK_EQUAL("1.01", fixed_t::exact("1.005").to_string(2));
  BOOST_CHECK_EQUAL("0.000000000000000001",
                    fixed_t::exact("1e-18").to_string());

  // Rounding to zero never prints a negative sign
  BOOST_CHECK_EQUAL("0.00", fixed_t::exact("-0.001").to_string(2));

  std::ostringstream out;
  out << fixed_t::exact("-1234.5");
  BOOST_CHECK_EQUAL("-1234.5", out.str());
}

BOOST_AUTO_TEST_SUITE_END()
