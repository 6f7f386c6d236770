#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE utils
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "utils.h"
#include "unistring.h"

using namespace budget;

BOOST_AUTO_TEST_SUITE(utils)

BOOST_AUTO_TEST_CASE(testSplitArguments)
{
  strings_list args = split_arguments("add 2024/01/01 \"Corner shop\" -4.50");
  BOOST_REQUIRE_EQUAL(4U, args.size());
  strings_list::const_iterator i = args.begin();
  BOOST_CHECK_EQUAL(string("add"), *i++);
  BOOST_CHECK_EQUAL(string("2024/01/01"), *i++);
  BOOST_CHECK_EQUAL(string("Corner shop"), *i++);
  BOOST_CHECK_EQUAL(string("-4.50"), *i);

  args = split_arguments("  recur 'semi monthly'  it\\'s  ");
  BOOST_REQUIRE_EQUAL(3U, args.size());
  BOOST_CHECK_EQUAL(string("semi monthly"), *(++args.begin()));
  BOOST_CHECK_EQUAL(string("it's"), args.back());

  BOOST_CHECK(split_arguments("").empty());
  BOOST_CHECK_THROW(split_arguments("trailing\\"), std::logic_error);
}

BOOST_AUTO_TEST_CASE(testUnistring)
{
  unistring plain("Rent");
  BOOST_CHECK_EQUAL(4U, plain.length());

  unistring accented("Caf\xC3\xA9 cr\xC3\xA8me");
  BOOST_CHECK_EQUAL(10U, accented.width());
  BOOST_CHECK_EQUAL(string("Caf\xC3\xA9"), accented.extract(0, 4));

  BOOST_CHECK_EQUAL(string("Rent"), budget::truncate("Rent", 10));
  BOOST_CHECK_EQUAL(string("Caf.."), budget::truncate("Caf\xC3\xA9 cr\xC3\xA8me", 5));
  BOOST_CHECK_EQUAL(string("Ca"), budget::truncate("Caf\xC3\xA9", 2));
}

BOOST_AUTO_TEST_CASE(testJustify)
{
  std::ostringstream out;
  justify(out, "ab", 5);
  out << '|';
  justify(out, "-1.00", 8, true);
  BOOST_CHECK_EQUAL(string("ab   |   -1.00"), out.str());

  out.str("");
  justify(out, "Caf\xC3\xA9", 6);
  out << '|';
  BOOST_CHECK_EQUAL(string("Caf\xC3\xA9  |"), out.str());
}

BOOST_AUTO_TEST_SUITE_END()
