/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "session.h"
#include "textual.h"
#include "period.h"
#include "register.h"
#include "unistring.h"

namespace budget {

namespace {
  // Set by normalize_options(), so that a repeated --input-date-format
  // at the prompt does not stack the same reader twice.
  optional<string> applied_input_format;

  string checked_payee(const string& text)
  {
    string payee(text);
    trim(payee);

    if (payee.empty())
      throw_(usage_error, _("A description may not be empty"));

    if (payee.find('\t') != string::npos ||
        payee.find("  ") != string::npos ||
        payee.find(';') != string::npos)
      throw_(usage_error,
             _f("A description may not contain tabs, double spaces or ';': %1%")
             % payee);

    return payee;
  }

  string joined(strings_list::const_iterator begin,
                strings_list::const_iterator end)
  {
    std::ostringstream out;
    for (strings_list::const_iterator i = begin; i != end; ++i) {
      if (i != begin)
        out << ' ';
      out << *i;
    }
    return out.str();
  }

  /** The record numbered `arg' (from 1, in file order), as the listing
      commands show them. */
  template <typename T>
  T * numbered(const std::list<T *>& records, const string& arg,
               const char * what)
  {
    std::size_t index = 0;
    try {
      index = lexical_cast<std::size_t>(arg);
    }
    catch (const bad_lexical_cast&) {
      throw_(usage_error, _f("Not a %1% number: %2%") % what % arg);
    }
    if (index < 1 || index > records.size())
      throw_(usage_error, _f("There is no %1% numbered %2%") % what % arg);

    typename std::list<T *>::const_iterator i = records.begin();
    std::advance(i, index - 1);
    return *i;
  }

  template <typename T>
  void list_numbered(std::ostream& out, const std::list<T *>& records,
                     void (*print)(std::ostream&, const T&))
  {
    std::size_t index = 0;
    foreach (const T * record, records) {
      out << '[' << ++index << "] ";
      print(out, *record);
    }
  }

  void warn_if_ended(const recurrence_rule_t& rule, const string& payee,
                     const date_t& today)
  {
    if (optional<date_t> last = last_occurrence(rule))
      if (*last < today)
        warning_(_f("Recurring entry '%1%' ended on %2%")
                 % payee % format_date(*last));
  }
}

session_t::session_t()
  : journal(new journal_t), startup_log_level(_log_level)
{
  options.add(option_t("begin_", 'b'));
  options.add(option_t("date_format_"));
  options.add(option_t("debug_"));
  options.add(option_t("end_", 'e'));
  options.add(option_t("file_", 'f'));
  options.add(option_t("forecast_days_"));
  options.add(option_t("help", 'h'));
  options.add(option_t("init_file_"));
  options.add(option_t("input_date_format_"));
  options.add(option_t("now_"));
  options.add(option_t("options"));
  options.add(option_t("precision_"));
  options.add(option_t("trace_"));
  options.add(option_t("verbose"));
  options.add(option_t("version"));

  options["forecast_days_"].value = "30";
  options["precision_"].value     = "2";
}

session_t::~session_t()
{
}

path session_t::journal_path() const
{
  if (options["file_"])
    return resolve_path(options["file_"].str());
  return path("budget.dat");
}

journal_t * session_t::read_journal_files()
{
  INFO_START(journal, "Read journal file");

  journal.reset(new journal_t);

  path pathname(journal_path());
  if (exists(pathname)) {
    std::size_t count = journal->read(pathname);
    INFO("Found " << count << " records");
  } else {
    INFO("Journal file " << pathname << " does not exist yet");
  }

  INFO_FINISH(journal);

  return journal.get();
}

void session_t::apply_log_options()
{
  // Start again from what the command line set, so that options pushed
  // for one line at the prompt stop logging once they are popped.
  _log_level = startup_log_level;

  if (options["verbose"] && _log_level < LOG_INFO)
    _log_level = LOG_INFO;

#if DEBUG_ON
  if (options["debug_"]) {
    string category(options["debug_"].str());
    if (! _log_category || *_log_category != category) {
      _log_category    = category;
      _log_category_re = none;
    }
    if (_log_level < LOG_DEBUG)
      _log_level = LOG_DEBUG;
  }
#endif

#if TRACING_ON
  if (options["trace_"]) {
    try {
      _trace_level = lexical_cast<uint16_t>(options["trace_"].str());
    }
    catch (const bad_lexical_cast&) {
      throw_(option_error, _f("Argument to --trace must be an integer: %1%")
             % options["trace_"].value);
    }
    if (_log_level < LOG_TRACE)
      _log_level = LOG_TRACE;
  }
#endif
}

void session_t::normalize_options()
{
  apply_log_options();

  if (options["date_format_"])
    set_date_format(options["date_format_"].str().c_str());
  else
    set_date_format("%Y-%m-%d");

  if (options["input_date_format_"]) {
    string format(options["input_date_format_"].str());
    if (! applied_input_format || *applied_input_format != format) {
      // This changes static variables inside times.h, which affects the
      // basic date parser.
      set_input_date_format(format.c_str());
      applied_input_format = format;
    }
  }

  try {
    amount_t::display_precision =
      lexical_cast<amount_t::precision_t>(options["precision_"].str());
  }
  catch (const bad_lexical_cast&) {
    throw_(option_error, _f("Argument to --precision must be an integer: %1%")
           % options["precision_"].value);
  }

  try {
    long days = lexical_cast<long>(options["forecast_days_"].str());
    if (days < 0)
      throw_(option_error, _("Argument to --forecast-days may not be negative"));
  }
  catch (const bad_lexical_cast&) {
    throw_(option_error,
           _f("Argument to --forecast-days must be an integer: %1%")
           % options["forecast_days_"].value);
  }

  if (optional<date_t> now = option_date("now_"))
    epoch = datetime_t(*now);
  else
    epoch = none;

  DEBUG("session.options", "Today is " << today());
}

date_t session_t::today() const
{
  return CURRENT_DATE();
}

optional<date_t> session_t::option_date(const char * name) const
{
  const option_t& opt(options[name]);
  if (! opt)
    return none;

  try {
    return parse_date(opt.str());
  }
  catch (const date_error&) {
    add_error_context(_f("While parsing option %1%") % opt.desc());
    throw;
  }
}

date_t session_t::default_begin() const
{
  if (optional<date_t> earliest = journal->earliest_date())
    return *earliest;
  return today();
}

date_t session_t::forecast_end() const
{
  long days = lexical_cast<long>(options["forecast_days_"].str());
  return today() + gregorian::days(days);
}

namespace {
  /** A window where one side was defaulted never ends up inverted; an
      inverted window given explicitly is left for the engine to reject. */
  std::pair<date_t, date_t> window(const optional<date_t>& begin,
                                   const date_t&           default_begin,
                                   const optional<date_t>& end,
                                   const date_t&           default_end)
  {
    date_t first = begin ? *begin : default_begin;
    date_t last  = end   ? *end   : default_end;

    if (last < first) {
      if (! end)
        last = first;
      else if (! begin)
        first = last;
    }
    return std::pair<date_t, date_t>(first, last);
  }
}

session_t::command_t session_t::look_for_precommand(const string& verb) const
{
  if (verb == "dates")
    return &session_t::dates_command;
  else if (verb == "period")
    return &session_t::period_command;
  return NULL;
}

session_t::command_t session_t::look_for_command(const string& verb) const
{
  if (verb == "register" || verb == "reg")
    return &session_t::register_command;
  else if (verb == "balance" || verb == "bal")
    return &session_t::balance_command;
  else if (verb == "transactions" || verb == "xacts")
    return &session_t::transactions_command;
  else if (verb == "recurring")
    return &session_t::recurring_command;
  else if (verb == "goals")
    return &session_t::goals_command;
  else if (verb == "add")
    return &session_t::add_command;
  else if (verb == "edit")
    return &session_t::edit_command;
  else if (verb == "delete")
    return &session_t::delete_command;
  else if (verb == "recur")
    return &session_t::recur_command;
  else if (verb == "replace")
    return &session_t::replace_command;
  else if (verb == "unrecur")
    return &session_t::unrecur_command;
  else if (verb == "goal")
    return &session_t::goal_command;
  else if (verb == "toggle")
    return &session_t::toggle_command;
  else if (verb == "post")
    return &session_t::post_command;
  return NULL;
}

void session_t::dates_command(const strings_list& args, std::ostream& out)
{
  if (args.empty())
    throw_(usage_error, _("Usage: dates PERIOD"));

  recurrence_rule_t rule(parse_period(joined(args.begin(), args.end())));
  date_t            first(first_occurrence(rule));

  date_t default_end;
  if (optional<date_t> last = last_occurrence(rule))
    default_end = *last;
  else
    default_end = add_years(option_date("begin_") ?
                            *option_date("begin_") : first, 1);

  std::pair<date_t, date_t> range(window(option_date("begin_"), first,
                                         option_date("end_"), default_end));

  TRACE_START(dates, 1, "Generated occurrence dates");

  foreach (const date_t& when,
           generate_occurrences(rule, range.first, range.second))
    out << format_date(when) << '\n';

  TRACE_FINISH(dates, 1);
}

void session_t::period_command(const strings_list& args, std::ostream& out)
{
  if (args.empty())
    throw_(usage_error, _("Usage: period PERIOD"));

  string expr(joined(args.begin(), args.end()));

  show_period_tokens(out, expr);
  out << std::endl;

  recurrence_rule_t rule(parse_period(expr));

  out << _("--- Canonical form ---") << std::endl
      << format_period(rule) << std::endl << std::endl;

  out << _("--- Sample dates ---") << std::endl;

  int shown = 0;
  foreach (const date_t& when,
           generate_occurrences(rule, first_occurrence(rule),
                                date_t(gregorian::max_date_time))) {
    out << format_date(when) << std::endl;
    if (++shown == 5)
      break;
  }
}

void session_t::register_command(const strings_list& args, std::ostream& out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: register"));

  std::pair<date_t, date_t> range(window(option_date("begin_"),
                                         default_begin(),
                                         option_date("end_"), forecast_end()));

  row_handler_ptr handler(new format_rows(out));
  handler.reset(new filter_rows(handler, range.first));
  handler.reset(new calc_rows(handler));

  pass_register_rows(*journal, range.first, range.second, handler);
}

void session_t::balance_command(const strings_list& args, std::ostream& out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: balance"));

  std::pair<date_t, date_t> range(window(option_date("begin_"),
                                         default_begin(),
                                         option_date("end_"), forecast_end()));

  amount_t total(balance_report(*journal, range.first, range.second));

  justify(out, total.to_string(), 12, true);
  out << "  " << format_date(range.second) << std::endl;
}

void session_t::transactions_command(const strings_list& args,
                                     std::ostream&       out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: transactions"));

  list_numbered(out, journal->xacts, print_xact);
}

void session_t::recurring_command(const strings_list& args, std::ostream& out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: recurring"));

  date_t      now(today());
  std::size_t index = 0;

  foreach (const period_xact_t * xact, journal->period_xacts) {
    out << '[' << ++index << "] ";
    print_period_xact(out, *xact);

    out << "    " << _("next: ");
    if (optional<date_t> next = next_occurrence(xact->rule, now))
      out << format_date(*next);
    else
      out << _("none");
    out << '\n';
  }
}

void session_t::add_command(const strings_list& args, std::ostream& out)
{
  if (args.size() < 3)
    throw_(usage_error, _("Usage: add DATE DESCRIPTION AMOUNT"));

  strings_list::const_iterator first = args.begin();
  strings_list::const_iterator last  = --args.end();

  date_t   when(parse_date(*first));
  string   payee(checked_payee(joined(++first, last)));
  amount_t amount(*last);

  std::unique_ptr<xact_t> xact(new xact_t(when, payee, amount));

  std::ostringstream text;
  print_xact(text, *xact);

  append(text.str());
  journal->add_xact(xact.get());
  xact.release();

  out << text.str();
}

void session_t::recur_command(const strings_list& args, std::ostream& out)
{
  if (args.size() < 3)
    throw_(usage_error, _("Usage: recur PERIOD DESCRIPTION AMOUNT"));

  strings_list::const_iterator amount_arg = --args.end();
  strings_list::const_iterator payee_arg  = amount_arg;
  --payee_arg;

  recurrence_rule_t rule(parse_period(joined(args.begin(), payee_arg)));
  string            payee(checked_payee(*payee_arg));
  amount_t          amount(*amount_arg);

  warn_if_ended(rule, payee, today());

  std::unique_ptr<period_xact_t> xact(new period_xact_t(rule, payee, amount));

  std::ostringstream text;
  print_period_xact(text, *xact);

  append(text.str());
  journal->add_period_xact(xact.get());
  xact.release();

  out << text.str();
}

void session_t::post_command(const strings_list& args, std::ostream& out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: post"));

  std::pair<date_t, date_t> range(window(option_date("begin_"),
                                         default_begin(),
                                         option_date("end_"), today()));

  std::list<xact_t> pending(pending_occurrences(*journal, range.first,
                                                range.second));
  if (pending.empty()) {
    INFO("No recurring entries are due");
    return;
  }

  std::ostringstream text;
  foreach (const xact_t& xact, pending)
    print_xact(text, xact);

  append(text.str());

  foreach (const xact_t& xact, pending) {
    std::unique_ptr<xact_t> posted(new xact_t(xact));
    journal->add_xact(posted.get());
    posted.release();
  }

  INFO("Posted " << pending.size() << " recurring transactions");

  out << text.str();
}

void session_t::goals_command(const strings_list& args, std::ostream& out)
{
  if (! args.empty())
    throw_(usage_error, _("Usage: goals"));

  list_numbered(out, journal->goals, print_goal);
}

void session_t::edit_command(const strings_list& args, std::ostream& out)
{
  if (args.size() < 4)
    throw_(usage_error, _("Usage: edit NUMBER DATE DESCRIPTION AMOUNT"));

  strings_list::const_iterator first = args.begin();
  strings_list::const_iterator last  = --args.end();
  string                       number(*first++);

  date_t   when(parse_date(*first));
  string   payee(checked_payee(joined(++first, last)));
  amount_t amount(*last);

  read_journal_files();
  const xact_t * old = numbered(journal->xacts, number, "transaction");

  xact_t xact(when, payee, amount);
  xact.note = old->note;

  std::ostringstream text;
  print_xact(text, xact);

  rewrite(*old, text.str());
  out << text.str();
}

void session_t::delete_command(const strings_list& args, std::ostream& out)
{
  if (args.size() != 1)
    throw_(usage_error, _("Usage: delete NUMBER"));

  read_journal_files();
  const xact_t * xact = numbered(journal->xacts, args.front(), "transaction");

  std::ostringstream text;
  print_xact(text, *xact);

  rewrite(*xact, none);
  out << _("Deleted ") << text.str();
}

void session_t::replace_command(const strings_list& args, std::ostream& out)
{
  if (args.size() < 4)
    throw_(usage_error,
           _("Usage: replace NUMBER PERIOD DESCRIPTION AMOUNT"));

  strings_list::const_iterator amount_arg = --args.end();
  strings_list::const_iterator payee_arg  = amount_arg;
  --payee_arg;

  recurrence_rule_t rule(parse_period(joined(++args.begin(), payee_arg)));
  string            payee(checked_payee(*payee_arg));
  amount_t          amount(*amount_arg);

  warn_if_ended(rule, payee, today());

  read_journal_files();
  const period_xact_t * old =
    numbered(journal->period_xacts, args.front(), "recurring entry");

  period_xact_t xact(rule, payee, amount);
  xact.note = old->note;

  std::ostringstream text;
  print_period_xact(text, xact);

  rewrite(*old, text.str());
  out << text.str();
}

void session_t::unrecur_command(const strings_list& args, std::ostream& out)
{
  if (args.size() != 1)
    throw_(usage_error, _("Usage: unrecur NUMBER"));

  read_journal_files();
  const period_xact_t * xact =
    numbered(journal->period_xacts, args.front(), "recurring entry");

  std::ostringstream text;
  print_period_xact(text, *xact);

  rewrite(*xact, none);
  out << _("Deleted ") << text.str();
}

void session_t::goal_command(const strings_list& args, std::ostream& out)
{
  if (args.size() < 3)
    throw_(usage_error, _("Usage: goal DATE DESCRIPTION AMOUNT"));

  strings_list::const_iterator first = args.begin();
  strings_list::const_iterator last  = --args.end();

  date_t   when(parse_date(*first));
  string   payee(checked_payee(joined(++first, last)));
  amount_t amount(*last);

  std::unique_ptr<goal_t> goal(new goal_t(when, payee, amount));

  std::ostringstream text;
  print_goal(text, *goal);

  append(text.str());
  journal->add_goal(goal.get());
  goal.release();

  out << text.str();
}

void session_t::toggle_command(const strings_list& args, std::ostream& out)
{
  if (args.size() != 1)
    throw_(usage_error, _("Usage: toggle NUMBER"));

  read_journal_files();
  const goal_t * old = numbered(journal->goals, args.front(), "goal");

  goal_t goal(old->date, old->payee, old->amount, ! old->enabled);
  goal.note = old->note;

  std::ostringstream text;
  print_goal(text, goal);

  rewrite(*old, text.str());
  out << text.str();
}

void session_t::append(const string& text)
{
  append_to_journal(journal_path(), text);
}

void session_t::rewrite(const item_t& item, const optional<string>& text)
{
  if (! item.pos || item.pos->beg_line == 0)
    throw_(std::logic_error,
           _f("The %1% was not read from the journal file")
           % item.description());

  rewrite_journal_line(journal_path(), item.pos->beg_line, text);

  // Line numbers after the change have shifted, and `item' is gone.
  read_journal_files();
}

} // namespace budget
