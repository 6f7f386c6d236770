#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE period
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "period.h"

using namespace budget;

struct period_fixture {
  period_fixture() {
    times_initialize();
  }
  ~period_fixture() {
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(period, period_fixture)

BOOST_AUTO_TEST_CASE(testAdverbs)
{
  recurrence_rule_t rule = parse_period("monthly from 2024/01/31");
  BOOST_CHECK(std::holds_alternative<monthly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(1L, rule.interval());
  BOOST_CHECK(rule.anchor_date() == parse_date("2024/01/31"));
  BOOST_CHECK(std::holds_alternative<never_t>(rule.end_condition()));

  rule = parse_period("biweekly from 2024/01/05");
  BOOST_CHECK(std::holds_alternative<weekly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(2L, rule.interval());

  rule = parse_period("quarterly from 2024/01/05");
  BOOST_CHECK(std::holds_alternative<monthly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(3L, rule.interval());

  rule = parse_period("annually since 2020/02/29");
  BOOST_CHECK(std::holds_alternative<yearly_t>(rule.frequency()));
}

BOOST_AUTO_TEST_CASE(testSemiMonthly)
{
  recurrence_rule_t rule = parse_period("semi-monthly from 2024-03-20");
  BOOST_CHECK(std::holds_alternative<semi_monthly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(1L, rule.interval());

  rule = parse_period("twice monthly from 2024/03/01");
  BOOST_CHECK(std::holds_alternative<semi_monthly_t>(rule.frequency()));

  rule = parse_period("semimonthly every other month from 2024/03/01");
  BOOST_CHECK(std::holds_alternative<semi_monthly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(2L, rule.interval());
}

BOOST_AUTO_TEST_CASE(testEvery)
{
  recurrence_rule_t rule = parse_period("every 3 days from 2024/01/01");
  BOOST_CHECK(std::holds_alternative<daily_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(3L, rule.interval());

  rule = parse_period("every other week from 2024/01/01");
  BOOST_CHECK(std::holds_alternative<weekly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(2L, rule.interval());

  rule = parse_period("every fortnight from 2024/01/01");
  BOOST_CHECK(std::holds_alternative<weekly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(2L, rule.interval());

  rule = parse_period("every 2 quarters from 2024/01/01");
  BOOST_CHECK(std::holds_alternative<monthly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(6L, rule.interval());

  rule = parse_period("every year from 2024/01/01");
  BOOST_CHECK(std::holds_alternative<yearly_t>(rule.frequency()));
  BOOST_CHECK_EQUAL(1L, rule.interval());
}

BOOST_AUTO_TEST_CASE(testEndConditions)
{
  recurrence_rule_t rule =
    parse_period("weekly from 2024/01/01 until 2024/03/01");
  const until_t * until = std::get_if<until_t>(&rule.end_condition());
  BOOST_REQUIRE(until);
  BOOST_CHECK(until->date == parse_date("2024/03/01"));

  rule = parse_period("weekly from 2024/01/01 for 3 times");
  const count_t * count = std::get_if<count_t>(&rule.end_condition());
  BOOST_REQUIRE(count);
  BOOST_CHECK_EQUAL(3L, count->n);

  rule = parse_period("weekly from 2024/01/01 for 12");
  count = std::get_if<count_t>(&rule.end_condition());
  BOOST_REQUIRE(count);
  BOOST_CHECK_EQUAL(12L, count->n);
}

BOOST_AUTO_TEST_CASE(testErrors)
{
  BOOST_CHECK_THROW(parse_period(""), period_error);
  BOOST_CHECK_THROW(parse_period("monthly"), period_error);
  BOOST_CHECK_THROW(parse_period("hourly from 2024/01/01"), period_error);
  BOOST_CHECK_THROW(parse_period("monthly from 2024/01/01 and more"),
                    period_error);
  BOOST_CHECK_THROW(parse_period("every 2 week from 2024/01/01"),
                    period_error);
  BOOST_CHECK_THROW(parse_period("monthly from 2024/13/01"), date_error);
  BOOST_CHECK_THROW(parse_period("every 5000000000000000000 fortnights"
                                 " from 2024/01/01"), period_error);
  BOOST_CHECK_THROW(parse_period("every 4000000000000000000 quarters"
                                 " from 2024/01/01"), period_error);

  // A well-formed expression can still describe an invalid rule.
  BOOST_CHECK_THROW(parse_period("every 0 days from 2024/01/01"),
                    invalid_rule_error);
  BOOST_CHECK_THROW(parse_period("monthly from 2024/05/01 until 2024/04/01"),
                    invalid_rule_error);
}

BOOST_AUTO_TEST_CASE(testCanonicalForm)
{
  BOOST_CHECK_EQUAL(string("monthly from 2024/01/31"),
                    format_period(parse_period("monthly since 2024-01-31")));
  BOOST_CHECK_EQUAL(string("semi-monthly every 2 months from 2024/03/01 for 5 times"),
                    format_period(parse_period("semimonthly every 2 months "
                                               "from 2024/03/01 for 5")));
  BOOST_CHECK_EQUAL(string("every 10 days from 2024/01/01 until 2024/02/01"),
                    format_period(parse_period("every 10 days from 2024/01/01 "
                                               "to 2024/02/01")));

  // The canonical form reads back as the same rule.
  const char * exprs[] = {
    "semi-annually from 2023/07/01",
    "biweekly from 2024/01/05 for 26 times",
    "every 5 weeks from 2024/01/05",
    "every 2 years from 2024/02/29 until 2032/03/01",
    "twice monthly from 2024/03/09"
  };
  foreach (const char * expr, exprs) {
    recurrence_rule_t rule = parse_period(expr);
    BOOST_CHECK(rule == parse_period(format_period(rule)));
  }
}

BOOST_AUTO_TEST_CASE(testShowTokens)
{
  std::ostringstream out;
  show_period_tokens(out, "every 2 weeks from 2024/01/01");

  string text(out.str());
  BOOST_CHECK(starts_with(text, "--- Period expression tokens ---"));
  BOOST_CHECK(contains(text, "TOK_EVERY"));
  BOOST_CHECK(contains(text, "TOK_WEEKS"));
  BOOST_CHECK(contains(text, "END_REACHED"));
}

BOOST_AUTO_TEST_SUITE_END()
