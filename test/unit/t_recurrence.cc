#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE recurrence
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "recurrence.h"

using namespace budget;

struct recurrence_fixture {
  recurrence_fixture() {
    times_initialize();
  }
  ~recurrence_fixture() {
    times_shutdown();
  }
};

namespace {
  date_t d(const int y, const int m, const int day) {
    return date_t(static_cast<unsigned short>(y),
                  static_cast<unsigned short>(m),
                  static_cast<unsigned short>(day));
  }

  std::vector<date_t> dates(const occurrences_t& range) {
    std::vector<date_t> result;
    foreach (const date_t& when, range)
      result.push_back(when);
    return result;
  }
}

BOOST_FIXTURE_TEST_SUITE(recurrence, recurrence_fixture)

BOOST_AUTO_TEST_CASE(testCreateValidatesRules)
{
  BOOST_CHECK_THROW(recurrence_rule_t::create(daily_t(), d(2024, 1, 1), 0),
                    invalid_rule_error);
  BOOST_CHECK_THROW(recurrence_rule_t::create(weekly_t(), d(2024, 1, 1), -3),
                    invalid_rule_error);
  BOOST_CHECK_THROW(recurrence_rule_t::create(monthly_t(), d(2024, 5, 1), 1,
                                              until_t(d(2024, 4, 30))),
                    invalid_rule_error);
  BOOST_CHECK_THROW(recurrence_rule_t::create(monthly_t(), d(2024, 5, 1), 1,
                                              count_t(0)),
                    invalid_rule_error);
  BOOST_CHECK_THROW(recurrence_rule_t::create(monthly_t(), date_t(), 1),
                    invalid_rule_error);

  // An UNTIL date equal to the anchor is allowed.
  recurrence_rule_t rule =
    recurrence_rule_t::create(monthly_t(), d(2024, 5, 1), 1,
                              until_t(d(2024, 5, 1)));
  BOOST_CHECK_EQUAL(1, rule.interval());
  BOOST_CHECK(rule.anchor_date() == d(2024, 5, 1));
  BOOST_CHECK(std::holds_alternative<monthly_t>(rule.frequency()));
  BOOST_CHECK(std::holds_alternative<until_t>(rule.end_condition()));
}

BOOST_AUTO_TEST_CASE(testInvertedWindow)
{
  recurrence_rule_t rule = recurrence_rule_t::create(daily_t(), d(2024, 1, 1));

  BOOST_CHECK_THROW(generate_occurrences(rule, d(2024, 2, 1), d(2024, 1, 31)),
                    invalid_window_error);

  // A single-day window is fine.
  std::vector<date_t> one(dates(generate_occurrences(rule, d(2024, 1, 5),
                                                     d(2024, 1, 5))));
  BOOST_REQUIRE_EQUAL(1U, one.size());
  BOOST_CHECK(one[0] == d(2024, 1, 5));
}

BOOST_AUTO_TEST_CASE(testDailyInterval)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(daily_t(), d(2024, 1, 1), 3);

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 2),
                                                     d(2024, 1, 12))));
  BOOST_REQUIRE_EQUAL(3U, got.size());
  BOOST_CHECK(got[0] == d(2024, 1, 4));
  BOOST_CHECK(got[1] == d(2024, 1, 7));
  BOOST_CHECK(got[2] == d(2024, 1, 10));
}

BOOST_AUTO_TEST_CASE(testWeeklyBeforeAnchor)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(weekly_t(), d(2024, 3, 4), 2);

  // Nothing is produced before the anchor, even when the window opens early.
  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 1),
                                                     d(2024, 4, 1))));
  BOOST_REQUIRE_EQUAL(3U, got.size());
  BOOST_CHECK(got[0] == d(2024, 3, 4));
  BOOST_CHECK(got[1] == d(2024, 3, 18));
  BOOST_CHECK(got[2] == d(2024, 4, 1));

  BOOST_CHECK(generate_occurrences(rule, d(2023, 1, 1),
                                   d(2023, 12, 31)).empty());
}

BOOST_AUTO_TEST_CASE(testMonthlyClampsToMonthEnd)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(monthly_t(), d(2024, 1, 31));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 1),
                                                     d(2024, 5, 31))));
  BOOST_REQUIRE_EQUAL(5U, got.size());
  BOOST_CHECK(got[0] == d(2024, 1, 31));
  BOOST_CHECK(got[1] == d(2024, 2, 29));
  BOOST_CHECK(got[2] == d(2024, 3, 31));
  BOOST_CHECK(got[3] == d(2024, 4, 30));
  BOOST_CHECK(got[4] == d(2024, 5, 31));

  // Outside a leap year February ends on the 28th.
  std::vector<date_t> later(dates(generate_occurrences(rule, d(2025, 2, 1),
                                                       d(2025, 3, 31))));
  BOOST_REQUIRE_EQUAL(2U, later.size());
  BOOST_CHECK(later[0] == d(2025, 2, 28));
  BOOST_CHECK(later[1] == d(2025, 3, 31));
}

BOOST_AUTO_TEST_CASE(testMonthlyInterval)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(monthly_t(), d(2024, 1, 15), 3);

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 2, 1),
                                                     d(2024, 12, 31))));
  BOOST_REQUIRE_EQUAL(3U, got.size());
  BOOST_CHECK(got[0] == d(2024, 4, 15));
  BOOST_CHECK(got[1] == d(2024, 7, 15));
  BOOST_CHECK(got[2] == d(2024, 10, 15));
}

BOOST_AUTO_TEST_CASE(testSemiMonthly)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(semi_monthly_t(), d(2024, 3, 20));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 3, 1),
                                                     d(2024, 4, 30))));
  BOOST_REQUIRE_EQUAL(4U, got.size());
  BOOST_CHECK(got[0] == d(2024, 3, 1));
  BOOST_CHECK(got[1] == d(2024, 3, 15));
  BOOST_CHECK(got[2] == d(2024, 4, 1));
  BOOST_CHECK(got[3] == d(2024, 4, 15));

  // February holds both days as well.
  std::vector<date_t> feb(dates(generate_occurrences(rule, d(2025, 2, 2),
                                                     d(2025, 2, 28))));
  BOOST_REQUIRE_EQUAL(1U, feb.size());
  BOOST_CHECK(feb[0] == d(2025, 2, 15));
}

BOOST_AUTO_TEST_CASE(testSemiMonthlySkipsMonths)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(semi_monthly_t(), d(2024, 1, 1), 2);

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 10),
                                                     d(2024, 5, 31))));
  BOOST_REQUIRE_EQUAL(5U, got.size());
  BOOST_CHECK(got[0] == d(2024, 1, 15));
  BOOST_CHECK(got[1] == d(2024, 3, 1));
  BOOST_CHECK(got[2] == d(2024, 3, 15));
  BOOST_CHECK(got[3] == d(2024, 5, 1));
  BOOST_CHECK(got[4] == d(2024, 5, 15));
}

BOOST_AUTO_TEST_CASE(testYearlyLeapDay)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(yearly_t(), d(2024, 2, 29));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 1),
                                                     d(2028, 12, 31))));
  BOOST_REQUIRE_EQUAL(5U, got.size());
  BOOST_CHECK(got[0] == d(2024, 2, 29));
  BOOST_CHECK(got[1] == d(2025, 2, 28));
  BOOST_CHECK(got[2] == d(2026, 2, 28));
  BOOST_CHECK(got[3] == d(2027, 2, 28));
  BOOST_CHECK(got[4] == d(2028, 2, 29));
}

BOOST_AUTO_TEST_CASE(testCountIsGlobal)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(weekly_t(), d(2024, 1, 1), 1, count_t(3));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2024, 1, 8),
                                                     d(2024, 12, 31))));
  BOOST_REQUIRE_EQUAL(2U, got.size());
  BOOST_CHECK(got[0] == d(2024, 1, 8));
  BOOST_CHECK(got[1] == d(2024, 1, 15));

  BOOST_CHECK(generate_occurrences(rule, d(2024, 1, 16),
                                   d(2024, 12, 31)).empty());

  optional<date_t> last = last_occurrence(rule);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(2024, 1, 15));
}

BOOST_AUTO_TEST_CASE(testUntilIsInclusive)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(monthly_t(), d(2024, 1, 10), 1,
                              until_t(d(2024, 3, 10)));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(2023, 1, 1),
                                                     d(2025, 1, 1))));
  BOOST_REQUIRE_EQUAL(3U, got.size());
  BOOST_CHECK(got[2] == d(2024, 3, 10));

  optional<date_t> last = last_occurrence(rule);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(2024, 3, 10));

  BOOST_CHECK(generate_occurrences(rule, d(2024, 3, 11),
                                   d(2024, 12, 31)).empty());
}

BOOST_AUTO_TEST_CASE(testRestartable)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(semi_monthly_t(), d(2024, 6, 1));

  occurrences_t range(generate_occurrences(rule, d(2024, 6, 1),
                                           d(2024, 9, 30)));

  std::vector<date_t> first(dates(range));
  std::vector<date_t> second(dates(range));
  BOOST_CHECK(first == second);
  BOOST_CHECK(first == dates(generate_occurrences(rule, d(2024, 6, 1),
                                                  d(2024, 9, 30))));

  for (std::size_t i = 1; i < first.size(); i++)
    BOOST_CHECK(first[i - 1] < first[i]);
}

BOOST_AUTO_TEST_CASE(testWindowIsSubsetOfLargerWindow)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(monthly_t(), d(2020, 8, 31), 1, count_t(40));

  std::vector<date_t> all(dates(generate_occurrences(rule, d(2020, 1, 1),
                                                     d(2025, 1, 1))));
  BOOST_CHECK_EQUAL(40U, all.size());

  std::vector<date_t> part(dates(generate_occurrences(rule, d(2021, 6, 1),
                                                      d(2022, 6, 30))));
  foreach (const date_t& when, part)
    BOOST_CHECK(std::find(all.begin(), all.end(), when) != all.end());
  BOOST_CHECK_EQUAL(13U, part.size());
}

BOOST_AUTO_TEST_CASE(testNextOccurrence)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(weekly_t(), d(2024, 1, 1), 1, count_t(2));

  optional<date_t> next = next_occurrence(rule, d(2023, 6, 1));
  BOOST_REQUIRE(next);
  BOOST_CHECK(*next == d(2024, 1, 1));

  next = next_occurrence(rule, d(2024, 1, 2));
  BOOST_REQUIRE(next);
  BOOST_CHECK(*next == d(2024, 1, 8));

  BOOST_CHECK(! next_occurrence(rule, d(2024, 1, 9)));

  recurrence_rule_t forever =
    recurrence_rule_t::create(daily_t(), d(2024, 1, 1));
  BOOST_CHECK(! last_occurrence(forever));
}

BOOST_AUTO_TEST_CASE(testCalendarEdge)
{
  recurrence_rule_t rule =
    recurrence_rule_t::create(yearly_t(), d(9998, 6, 1));

  std::vector<date_t> got(dates(generate_occurrences(rule, d(9998, 1, 1),
                                                     d(9999, 12, 31))));
  BOOST_REQUIRE_EQUAL(2U, got.size());
  BOOST_CHECK(got[1] == d(9999, 6, 1));
}

BOOST_AUTO_TEST_CASE(testHugeCountStopsAtCalendarEnd)
{
  recurrence_rule_t daily =
    recurrence_rule_t::create(daily_t(), d(2024, 1, 1), 1,
                              count_t(LONG_MAX));
  optional<date_t> last = last_occurrence(daily);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(9999, 12, 31));

  recurrence_rule_t semi =
    recurrence_rule_t::create(semi_monthly_t(), d(2024, 1, 20), 1,
                              count_t(LONG_MAX - 1));
  last = last_occurrence(semi);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(9999, 12, 15));

  recurrence_rule_t monthly =
    recurrence_rule_t::create(monthly_t(), d(2024, 1, 31), 3,
                              count_t(LONG_MAX));
  last = last_occurrence(monthly);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(9999, 10, 31));

  // A count the calendar can hold is still honored exactly.
  recurrence_rule_t short_run =
    recurrence_rule_t::create(daily_t(), d(9999, 12, 29), 1, count_t(2));
  last = last_occurrence(short_run);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(9999, 12, 30));
}

BOOST_AUTO_TEST_CASE(testFirstOccurrence)
{
  recurrence_rule_t semi =
    recurrence_rule_t::create(semi_monthly_t(), d(2024, 3, 10), 1,
                              count_t(2));
  BOOST_CHECK(first_occurrence(semi) == d(2024, 3, 1));

  optional<date_t> last = last_occurrence(semi);
  BOOST_REQUIRE(last);
  BOOST_CHECK(*last == d(2024, 3, 15));

  std::vector<date_t> got(dates(generate_occurrences(semi,
                                                     first_occurrence(semi),
                                                     *last)));
  BOOST_REQUIRE_EQUAL(2U, got.size());
  BOOST_CHECK(got[0] == d(2024, 3, 1));
  BOOST_CHECK(got[1] == d(2024, 3, 15));

  recurrence_rule_t monthly =
    recurrence_rule_t::create(monthly_t(), d(2024, 3, 10));
  BOOST_CHECK(first_occurrence(monthly) == d(2024, 3, 10));
}

BOOST_AUTO_TEST_CASE(testFrequencyNames)
{
  BOOST_CHECK_EQUAL(string("daily"), frequency_name(daily_t()));
  BOOST_CHECK_EQUAL(string("semi-monthly"), frequency_name(semi_monthly_t()));
  BOOST_CHECK_EQUAL(string("yearly"), frequency_name(yearly_t()));
}

BOOST_AUTO_TEST_SUITE_END()
