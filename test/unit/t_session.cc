#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE session
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "session.h"
#include "period.h"
#include "register.h"

using namespace budget;

struct session_fixture {
  path      dir;
  path      file;
  session_t session;

  session_fixture() {
    times_initialize();
    amount_t::initialize();

    dir = boost::filesystem::temp_directory_path() /
      boost::filesystem::unique_path("budget-%%%%-%%%%");
    boost::filesystem::create_directories(dir);
    file = dir / "budget.dat";

    session.options["file_"].on("test", file.string());
    session.options["now_"].on("test", string("2024/03/01"));
    session.normalize_options();
    session.read_journal_files();
  }
  ~session_fixture() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(dir, ec);
    epoch = none;
    amount_t::shutdown();
    times_shutdown();
  }

  strings_list args(const char * line) {
    return split_arguments(line);
  }
};

BOOST_FIXTURE_TEST_SUITE(session_commands, session_fixture)

BOOST_AUTO_TEST_CASE(testOptions)
{
  strings_list in;
  in.push_back("-f");
  in.push_back("x.dat");
  in.push_back("--now=2024/03/01");
  in.push_back("add");
  in.push_back("2024/01/01");
  in.push_back("-20.00");
  in.push_back("--");
  in.push_back("--forecast-days");

  option_set_t options(session.options);
  strings_list rest = process_arguments(in, options);

  BOOST_REQUIRE_EQUAL(4U, rest.size());
  BOOST_CHECK_EQUAL(string("add"), rest.front());
  BOOST_CHECK_EQUAL(string("--forecast-days"), rest.back());
  BOOST_CHECK_EQUAL(string("x.dat"), options["file_"].str());
  BOOST_CHECK_EQUAL(string("2024/03/01"), options["now_"].str());
  BOOST_CHECK_EQUAL(string("30"), options["forecast_days_"].str());

  strings_list bad;
  bad.push_back("--no-such-option");
  BOOST_CHECK_THROW(process_arguments(bad, options), option_error);

  strings_list missing;
  missing.push_back("--begin");
  BOOST_CHECK_THROW(process_arguments(missing, options), option_error);

  const char * env[] = {
    "BUDGET_FORECAST_DAYS=10",
    "HOME=/nowhere",
    NULL
  };
  process_environment(env, "BUDGET_", options);
  BOOST_CHECK(options["forecast_days_"]);
  BOOST_CHECK_EQUAL(string("10"), options["forecast_days_"].str());
}

BOOST_AUTO_TEST_CASE(testNormalizeOptions)
{
  BOOST_CHECK(session.today() == date_t(2024, 3, 1));

  session.options["precision_"].on("test", string("many"));
  BOOST_CHECK_THROW(session.normalize_options(), option_error);

  session.options["precision_"].on("test", string("2"));
  session.options["forecast_days_"].on("test", string("-1"));
  BOOST_CHECK_THROW(session.normalize_options(), option_error);
}

BOOST_AUTO_TEST_CASE(testLogOptions)
{
  log_level_t startup = _log_level;

  const char * env[] = { "BUDGET_VERBOSE=1", NULL };
  process_environment(env, "BUDGET_", session.options);
  session.normalize_options();
  BOOST_CHECK(_log_level >= LOG_INFO);

  session.options["trace_"].on("test", string("deep"));
  BOOST_CHECK_THROW(session.normalize_options(), option_error);

  session.options["trace_"].on("test", string("2"));
  session.normalize_options();
  BOOST_CHECK_EQUAL(LOG_TRACE, _log_level);
  BOOST_CHECK_EQUAL(2, _trace_level);

  // Once the options are gone, logging returns to its starting level.
  session.options["trace_"].off();
  session.options["verbose"].off();
  session.normalize_options();
  BOOST_CHECK_EQUAL(startup, _log_level);
}

BOOST_AUTO_TEST_CASE(testRecordAndPost)
{
  std::ostringstream out;

  session.recur_command(args("monthly from 2024/01/15 Rent -800"), out);
  BOOST_CHECK_EQUAL(string("~ monthly from 2024/01/15  Rent  -800.00\n"),
                    out.str());

  out.str("");
  session.add_command(args("2024/01/15 Rent -800"), out);
  BOOST_CHECK_EQUAL(string("2024/01/15 Rent  -800.00\n"), out.str());

  // Only February is due: January was entered by hand and March lies
  // after today.
  out.str("");
  session.post_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("2024/02/15 Rent  -800.00\n"), out.str());

  out.str("");
  session.post_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string(""), out.str());

  // Everything written reads back the same.
  journal_t * journal = session.read_journal_files();
  BOOST_CHECK_EQUAL(2U, journal->xacts.size());
  BOOST_CHECK_EQUAL(1U, journal->period_xacts.size());

  out.str("");
  session.balance_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("    -2400.00  2024-03-31\n"), out.str());

  out.str("");
  session.recurring_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("[1] ~ monthly from 2024/01/15  Rent  -800.00\n"
                           "    next: 2024-03-15\n"), out.str());
}

BOOST_AUTO_TEST_CASE(testEditAndDelete)
{
  {
    boost::filesystem::ofstream journal_file(file);
    journal_file << "; household\n"
                 << "2024/01/10 Coffee  -5\n"
                 << "\n"
                 << "2024/01/12 Lunch  -12  ; with Sam\n";
  }
  session.read_journal_files();

  std::ostringstream out;
  session.transactions_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("[1] 2024/01/10 Coffee  -5.00\n"
                           "[2] 2024/01/12 Lunch  -12.00  ; with Sam\n"),
                    out.str());

  // An edit keeps the entry's note.
  out.str("");
  session.edit_command(args("2 2024/01/13 Team lunch -15.50"), out);
  BOOST_CHECK_EQUAL(string("2024/01/13 Team lunch  -15.50  ; with Sam\n"),
                    out.str());

  out.str("");
  session.delete_command(args("1"), out);
  BOOST_CHECK_EQUAL(string("Deleted 2024/01/10 Coffee  -5.00\n"), out.str());

  BOOST_REQUIRE_EQUAL(1U, session.journal->xacts.size());
  BOOST_CHECK(session.journal->xacts.front()->matches(
                date_t(2024, 1, 13), "Team lunch", amount_t("-15.50")));

  // Comments and blank lines are left where they were.
  std::ostringstream contents;
  {
    boost::filesystem::ifstream in(file);
    contents << in.rdbuf();
  }
  BOOST_CHECK_EQUAL(string("; household\n"
                           "\n"
                           "2024/01/13 Team lunch  -15.50  ; with Sam\n"),
                    contents.str());

  BOOST_CHECK_THROW(session.delete_command(args("2"), out), usage_error);
  BOOST_CHECK_THROW(session.delete_command(args("0"), out), usage_error);
  BOOST_CHECK_THROW(session.delete_command(args("first"), out), usage_error);
  BOOST_CHECK_THROW(session.edit_command(args("1 2024/01/13 Lunch"), out),
                    usage_error);
}

BOOST_AUTO_TEST_CASE(testReplaceAndUnrecur)
{
  std::ostringstream out;
  session.recur_command(args("monthly from 2024/01/15 Rent -800"), out);
  session.recur_command(args("weekly from 2024/02/05 Gym -10"), out);

  // A schedule changes by replacing its rule.
  out.str("");
  session.replace_command(args("1 monthly from 2024/03/01 Rent -850"), out);
  BOOST_CHECK_EQUAL(string("~ monthly from 2024/03/01  Rent  -850.00\n"),
                    out.str());

  BOOST_REQUIRE_EQUAL(2U, session.journal->period_xacts.size());
  const period_xact_t * rent = session.journal->period_xacts.front();
  BOOST_CHECK(rent->rule.anchor_date() == date_t(2024, 3, 1));
  BOOST_CHECK(rent->amount == amount_t(-850L));

  out.str("");
  session.unrecur_command(args("2"), out);
  BOOST_CHECK_EQUAL(string("Deleted ~ weekly from 2024/02/05  Gym  -10.00\n"),
                    out.str());

  out.str("");
  session.recurring_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("[1] ~ monthly from 2024/03/01  Rent  -850.00\n"
                           "    next: 2024-03-01\n"), out.str());

  BOOST_CHECK_THROW(session.unrecur_command(args("2"), out), usage_error);
  BOOST_CHECK_THROW(session.replace_command(args("1 Rent -850"), out),
                    usage_error);
}

BOOST_AUTO_TEST_CASE(testGoals)
{
  std::ostringstream out;
  session.goal_command(args("2024/06/01 Vacation 1500"), out);
  BOOST_CHECK_EQUAL(string("goal 2024/06/01 Vacation  1500.00\n"), out.str());

  out.str("");
  session.toggle_command(args("1"), out);
  BOOST_CHECK_EQUAL(string("goal off 2024/06/01 Vacation  1500.00\n"),
                    out.str());

  BOOST_REQUIRE_EQUAL(1U, session.journal->goals.size());
  BOOST_CHECK(! session.journal->goals.front()->enabled);

  out.str("");
  session.goals_command(strings_list(), out);
  BOOST_CHECK_EQUAL(string("[1] goal off 2024/06/01 Vacation  1500.00\n"),
                    out.str());

  // Goals never move the running balance.
  BOOST_CHECK(balance_report(*session.journal, date_t(2024, 1, 1),
                             date_t(2024, 12, 31)).is_zero());

  BOOST_CHECK_THROW(session.toggle_command(args("2"), out), usage_error);
}

BOOST_AUTO_TEST_CASE(testDatesCommand)
{
  std::ostringstream out;
  session.dates_command(args("monthly from 2024/01/31 for 3"), out);
  BOOST_CHECK_EQUAL(string("2024-01-31\n2024-02-29\n2024-03-31\n"), out.str());

  // A semi-monthly series anchored mid-month starts on the 1st, and that
  // date counts toward its limit.
  out.str("");
  session.dates_command(args("semimonthly from 2024/03/10 for 2"), out);
  BOOST_CHECK_EQUAL(string("2024-03-01\n2024-03-15\n"), out.str());

  out.str("");
  session.options["begin_"].on("test", string("2024/02/01"));
  session.options["end_"].on("test", string("2024/02/29"));
  session.dates_command(args("semimonthly from 2024/01/20"), out);
  BOOST_CHECK_EQUAL(string("2024-02-01\n2024-02-15\n"), out.str());

  session.options["begin_"].on("test", string("2024/03/01"));
  BOOST_CHECK_THROW(session.dates_command(args("daily from 2024/01/01"), out),
                    invalid_window_error);
}

BOOST_AUTO_TEST_CASE(testBadInput)
{
  std::ostringstream out;

  BOOST_CHECK_THROW(session.add_command(args("2024/01/15 Rent"), out),
                    usage_error);
  BOOST_CHECK_THROW(session.add_command(args("2024/01/15 Rent;x 10"), out),
                    usage_error);
  BOOST_CHECK_THROW(session.add_command(args("2024/01/15 Rent ten"), out),
                    amount_error);
  BOOST_CHECK_THROW(session.add_command(args("yesterday Rent 10"), out),
                    date_error);
  BOOST_CHECK_THROW(session.recur_command(args("monthly Rent 10"), out),
                    period_error);
  BOOST_CHECK_THROW(session.dates_command(strings_list(), out), usage_error);

  // Nothing was written.
  BOOST_CHECK(! exists(file));
}

BOOST_AUTO_TEST_SUITE_END()
