#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE amount
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "amount.h"

using namespace budget;

struct amount_fixture {
  amount_fixture() {
    amount_t::initialize();
    amount_t::display_precision = 2;
  }
  ~amount_fixture() {
    amount_t::shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(amount, amount_fixture)

BOOST_AUTO_TEST_CASE(testParser)
{
  amount_t x0;
  amount_t x1("1,200.50");
  amount_t x2("-$20.5");
  amount_t x3("+7");
  amount_t x4(" 0.125 ");

  BOOST_CHECK(x0.is_zero());
  BOOST_CHECK_EQUAL(string("2401/2"), x1.to_fullstring());
  BOOST_CHECK_EQUAL(string("-41/2"), x2.to_fullstring());
  BOOST_CHECK(x3 == amount_t(7L));
  BOOST_CHECK_EQUAL(string("1/8"), x4.to_fullstring());

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x2.valid());
}

BOOST_AUTO_TEST_CASE(testParserErrors)
{
  BOOST_CHECK_THROW(amount_t(""), amount_error);
  BOOST_CHECK_THROW(amount_t("-"), amount_error);
  BOOST_CHECK_THROW(amount_t("12."), amount_error);
  BOOST_CHECK_THROW(amount_t("1.2.3"), amount_error);
  BOOST_CHECK_THROW(amount_t("12,00"), amount_error);
  BOOST_CHECK_THROW(amount_t("1234,567"), amount_error);
  BOOST_CHECK_THROW(amount_t("1,234,56"), amount_error);
  BOOST_CHECK_THROW(amount_t("10 EUR"), amount_error);
  BOOST_CHECK_THROW(amount_t("$"), amount_error);
}

BOOST_AUTO_TEST_CASE(testArithmetic)
{
  amount_t x1("100.25");
  amount_t x2("-40.10");

  BOOST_CHECK(x1 + x2 == amount_t("60.15"));
  BOOST_CHECK(x1 - x2 == amount_t("140.35"));
  BOOST_CHECK(x2 * amount_t(2L) == amount_t("-80.2"));
  BOOST_CHECK(x1 / amount_t(4L) == amount_t("25.0625"));
  BOOST_CHECK_THROW(x1 / amount_t(0L), amount_error);

  BOOST_CHECK(-x2 == amount_t("40.10"));
  BOOST_CHECK(x2.abs() == amount_t("40.1"));
  BOOST_CHECK_EQUAL(-1, x2.sign());
  BOOST_CHECK(x2 < x1);
  BOOST_CHECK(x1 > x2);
  BOOST_CHECK(x1 >= x1);
  BOOST_CHECK(x1 != x2);

  amount_t total;
  total += x1;
  total += x2;
  total -= amount_t("60.15");
  BOOST_CHECK(total.is_zero());
  BOOST_CHECK(! total.is_nonzero());
}

BOOST_AUTO_TEST_CASE(testPrinting)
{
  BOOST_CHECK_EQUAL(string("1200.50"), amount_t("1,200.5").to_string());
  BOOST_CHECK_EQUAL(string("-20.50"), amount_t("-20.5").to_string());
  BOOST_CHECK_EQUAL(string("7.00"), amount_t(7L).to_string());
  BOOST_CHECK_EQUAL(string("0.33"),
                    (amount_t(1L) / amount_t(3L)).to_string());
  BOOST_CHECK_EQUAL(string("0.667"),
                    (amount_t(2L) / amount_t(3L)).to_string(3));

  // Rounding a tiny negative amount never shows a sign.
  BOOST_CHECK_EQUAL(string("0.00"), amount_t("-0.001").to_string());

  std::ostringstream out;
  out << amount_t("-3.5");
  BOOST_CHECK_EQUAL(string("-3.50"), out.str());

  amount_t::display_precision = 0;
  BOOST_CHECK_EQUAL(string("12"), amount_t("12.25").to_string());
}

BOOST_AUTO_TEST_CASE(testWrittenForm)
{
  BOOST_CHECK_EQUAL(string("12.50"), amount_t("12.5").to_written_string());
  BOOST_CHECK_EQUAL(string("0.125"), amount_t("0.125").to_written_string());
  BOOST_CHECK_EQUAL(string("-3.0001"),
                    amount_t("-3.0001").to_written_string());
  BOOST_CHECK_EQUAL(string("0.33"),
                    (amount_t(1L) / amount_t(3L)).to_written_string());
}

BOOST_AUTO_TEST_CASE(testUninitialized)
{
  amount_t::shutdown();
  BOOST_CHECK_THROW(amount_t("1.00").to_string(), amount_error);
  amount_t::initialize();
}

BOOST_AUTO_TEST_SUITE_END()
