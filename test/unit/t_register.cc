#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE register
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "register.h"
#include "textual.h"

using namespace budget;

struct register_fixture {
  journal_t journal;

  register_fixture() {
    times_initialize();
    amount_t::initialize();
    amount_t::display_precision = 2;
  }
  ~register_fixture() {
    amount_t::shutdown();
    times_shutdown();
  }

  void read(const char * text) {
    std::istringstream in(text);
    read_textual(journal, in);
  }
};

BOOST_FIXTURE_TEST_SUITE(register_report_tests, register_fixture)

BOOST_AUTO_TEST_CASE(testProjectionAndPosting)
{
  read("\
balance 2024/01/01  1000\n\
~ monthly from 2024/01/15  Rent  -800\n\
2024/01/15 Rent  -800\n\
2024/01/10 Coffee  -5\n");

  register_rows rows(register_report(journal, date_t(2024, 1, 1),
                                     date_t(2024, 3, 31)));
  BOOST_REQUIRE_EQUAL(5U, rows.size());

  BOOST_CHECK_EQUAL(register_row_t::SNAPSHOT, rows[0].kind);
  BOOST_CHECK(rows[0].total == amount_t(1000L));

  BOOST_CHECK_EQUAL(string("Coffee"), rows[1].payee);
  BOOST_CHECK_EQUAL(register_row_t::POSTED, rows[1].kind);
  BOOST_CHECK(rows[1].total == amount_t(995L));

  // The January rent was posted, so it is not projected a second time.
  BOOST_CHECK(rows[2].date == date_t(2024, 1, 15));
  BOOST_CHECK_EQUAL(register_row_t::POSTED, rows[2].kind);
  BOOST_CHECK(rows[2].total == amount_t(195L));

  BOOST_CHECK(rows[3].date == date_t(2024, 2, 15));
  BOOST_CHECK_EQUAL(register_row_t::PROJECTED, rows[3].kind);
  BOOST_CHECK(rows[3].total == amount_t(-605L));

  BOOST_CHECK(rows[4].date == date_t(2024, 3, 15));
  BOOST_CHECK(rows[4].total == amount_t(-1405L));

  BOOST_CHECK(balance_report(journal, date_t(2024, 1, 1),
                             date_t(2024, 3, 31)) == amount_t(-1405L));
}

BOOST_AUTO_TEST_CASE(testTotalsCarryIntoLaterWindow)
{
  read("\
balance 2024/01/01  1000\n\
~ monthly from 2024/01/15  Rent  -800\n\
2024/01/10 Coffee  -5\n");

  register_rows rows(register_report(journal, date_t(2024, 2, 1),
                                     date_t(2024, 2, 29)));
  BOOST_REQUIRE_EQUAL(1U, rows.size());
  BOOST_CHECK(rows[0].date == date_t(2024, 2, 15));
  BOOST_CHECK(rows[0].total == amount_t(-605L));
}

BOOST_AUTO_TEST_CASE(testSnapshotResetsTotal)
{
  read("\
balance 2024/01/01  1000\n\
~ monthly from 2024/01/15  Rent  -800\n\
balance 2024/02/20  100\n\
2024/02/20 Refund  25\n");

  register_rows rows(register_report(journal, date_t(2024, 1, 1),
                                     date_t(2024, 3, 31)));
  BOOST_REQUIRE_EQUAL(6U, rows.size());

  // A snapshot sorts ahead of transactions on the same day.
  BOOST_CHECK_EQUAL(register_row_t::SNAPSHOT, rows[3].kind);
  BOOST_CHECK(rows[3].total == amount_t(100L));
  BOOST_CHECK_EQUAL(string("Refund"), rows[4].payee);
  BOOST_CHECK(rows[4].total == amount_t(125L));
  BOOST_CHECK(rows[5].total == amount_t(-675L));

  // A window opening after the second snapshot starts from it.
  BOOST_CHECK(balance_report(journal, date_t(2024, 3, 1),
                             date_t(2024, 3, 31)) == amount_t(-675L));
}

BOOST_AUTO_TEST_CASE(testSemiMonthlyBalanceIgnoresWindowStart)
{
  read("~ semimonthly from 2024/03/10  Savings  -100\n");

  // The series starts on March 1st, ahead of its anchor, so the running
  // total at the end of March is the same wherever the window opens.
  BOOST_CHECK(balance_report(journal, date_t(2024, 3, 1),
                             date_t(2024, 3, 31)) == amount_t(-200L));
  BOOST_CHECK(balance_report(journal, date_t(2024, 3, 20),
                             date_t(2024, 3, 31)) == amount_t(-200L));

  BOOST_REQUIRE(journal.earliest_date());
  BOOST_CHECK(*journal.earliest_date() == date_t(2024, 3, 1));

  std::list<xact_t> pending(pending_occurrences(journal,
                                                *journal.earliest_date(),
                                                date_t(2024, 3, 31)));
  BOOST_REQUIRE_EQUAL(2U, pending.size());
  BOOST_CHECK(pending.front().date == date_t(2024, 3, 1));
}

BOOST_AUTO_TEST_CASE(testNoSnapshot)
{
  read("\
2024/01/05 Paycheck  2,000\n\
2024/01/06 Groceries  -120.45\n");

  BOOST_CHECK(balance_report(journal, date_t(2024, 2, 1),
                             date_t(2024, 2, 1)) == amount_t("1879.55"));
  BOOST_CHECK(register_report(journal, date_t(2024, 2, 1),
                              date_t(2024, 2, 1)).empty());

  journal_t empty;
  BOOST_CHECK(empty.empty());
  BOOST_CHECK(! journal.empty());
  BOOST_CHECK(balance_report(empty, date_t(2024, 1, 1),
                             date_t(2024, 12, 31)).is_zero());
}

BOOST_AUTO_TEST_CASE(testInvertedWindow)
{
  BOOST_CHECK_THROW(register_report(journal, date_t(2024, 2, 1),
                                    date_t(2024, 1, 1)),
                    invalid_window_error);
}

BOOST_AUTO_TEST_CASE(testPendingOccurrences)
{
  read("\
~ monthly from 2024/01/15  Rent  -800  ; apartment\n\
~ weekly from 2024/02/01 for 2  Allowance  20\n\
2024/01/15 Rent  -800\n");

  std::list<xact_t> pending(pending_occurrences(journal, date_t(2024, 1, 1),
                                                date_t(2024, 2, 20)));
  BOOST_REQUIRE_EQUAL(3U, pending.size());

  std::list<xact_t>::const_iterator i = pending.begin();
  BOOST_CHECK((*i).matches(date_t(2024, 2, 1), "Allowance", amount_t(20L)));
  ++i;
  BOOST_CHECK((*i).matches(date_t(2024, 2, 8), "Allowance", amount_t(20L)));
  ++i;
  BOOST_CHECK((*i).matches(date_t(2024, 2, 15), "Rent", amount_t(-800L)));
  BOOST_REQUIRE((*i).note);
  BOOST_CHECK_EQUAL(string("apartment"), *(*i).note);
}

BOOST_AUTO_TEST_CASE(testFormatRows)
{
  read("\
balance 2024/01/01  50\n\
~ monthly from 2024/01/15  Phone  -30\n");

  std::ostringstream out;
  row_handler_ptr handler(new format_rows(out));
  handler.reset(new calc_rows(handler));
  pass_register_rows(journal, date_t(2024, 1, 1), date_t(2024, 1, 31),
                     handler);

  std::vector<string> lines;
  std::istringstream in(out.str());
  string line;
  while (std::getline(in, line))
    lines.push_back(line);

  BOOST_REQUIRE_EQUAL(2U, lines.size());
  BOOST_CHECK(starts_with(lines[0], "2024-01-01 = Balance"));
  BOOST_CHECK(ends_with(lines[0], "50.00        50.00"));
  BOOST_CHECK(starts_with(lines[1], "2024-01-15 ~ Phone"));
  BOOST_CHECK(ends_with(lines[1], "-30.00        20.00"));
}

BOOST_AUTO_TEST_SUITE_END()
