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

#include "textual.h"
#include "period.h"

namespace budget {

namespace {
  struct parse_context_t
  {
    static const std::size_t MAX_LINE = 4096;

    std::istream& stream;
    path          pathname;
    char          linebuf[MAX_LINE + 1];
    std::size_t   linenum;
    std::size_t   errors;
    std::size_t   count;
    string        last;

    parse_context_t(std::istream& _stream, const path& _pathname)
      : stream(_stream), pathname(_pathname),
        linenum(0), errors(0), count(0) {
      linebuf[0] = '\0';
    }

    string location() const {
      return file_context(pathname, linenum);
    }
  };

  class instance_t : public noncopyable
  {
  public:
    journal_t&       journal;
    parse_context_t& context;
    std::istream&    in;
    string           current_line;

    instance_t(journal_t& _journal, parse_context_t& _context)
      : journal(_journal), context(_context), in(_context.stream) {}

    void parse();
    std::streamsize read_line(char *& line);
    void read_next_directive();

    void xact_directive(char * line);
    void period_xact_directive(char * line);
    bool general_directive(char * line);
    void balance_directive(char * line);
    void goal_directive(char * line);

    char *   split_note(char * line, optional<string>& note);
    string   parse_payee(const char * text);
    amount_t parse_amount_field(char * text);
    position_t here() const;
  };

  void instance_t::parse()
  {
    INFO("Parsing file " << context.pathname);

    TRACE_START(instance_parse, 1, "Done parsing file " << context.pathname);

    if (! in.good() || in.eof())
      return;

    context.linenum = 0;

    while (in.good() && ! in.eof()) {
      try {
        read_next_directive();
      }
      catch (const std::exception& err) {
        string current_context = error_context();

        add_error_context(_f("While parsing file %1%") % context.location());
        add_error_context(line_context(current_line));

        if (caught_signal != NONE_CAUGHT)
          throw;

        string err_context = error_context();
        if (! err_context.empty())
          std::cerr << err_context << std::endl;

        if (! current_context.empty())
          std::cerr << current_context << std::endl;

        std::cerr << _("Error: ") << err.what() << std::endl;
        context.errors++;
        if (! current_context.empty())
          context.last = current_context + "\n" + err.what();
        else
          context.last = err.what();
      }
    }

    TRACE_STOP(instance_parse, 1);
  }

  std::streamsize instance_t::read_line(char *& line)
  {
    assert(in.good());
    assert(! in.eof());           // no one should call us in that case

    check_for_signal();

    in.getline(context.linebuf, parse_context_t::MAX_LINE);
    std::streamsize len = in.gcount();

    if (in.fail() && ! in.eof() &&
        len == std::streamsize(parse_context_t::MAX_LINE - 1))
      throw_(parse_error,
             _f("Line exceeds %1% characters") % parse_context_t::MAX_LINE);

    if (len > 0) {
      context.linenum++;

      if (context.linenum == 1 &&
          utf8::starts_with_bom(context.linebuf,
                                context.linebuf + std::strlen(context.linebuf))) {
        line = &context.linebuf[3];
        len -= 3;
      } else {
        line = context.linebuf;
      }

      if (! in.eof()) {
        // if we are not at the end of the file, len includes the new line
        // character, even though it does not appear in linebuf
        --len;
      }

      // strip trailing whitespace
      while (len > 0 &&
             std::isspace(static_cast<unsigned char>(line[len - 1])))
        line[--len] = '\0';

      current_line = line;
      return len;
    }
    return 0;
  }

  void instance_t::read_next_directive()
  {
    char * line;
    std::streamsize len = read_line(line);
    if (len <= 0)
      return;

    DEBUG("textual.parse", "line " << context.linenum << ": " << line);

    switch (line[0]) {
    case ' ':
    case '\t': {
      char * p = skip_ws(line);
      if (*p != ';' && *p != '#')
        throw parse_error(_("Unexpected whitespace at beginning of line"));
      break;
    }

    case ';':                     // comments
    case '#':
    case '%':
    case '*':
    case '|':
      break;

    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
      xact_directive(line);
      break;

    case '~':                     // period xact
      period_xact_directive(line);
      break;

    default:                      // some other directive
      if (! general_directive(line))
        throw_(parse_error, _f("Unexpected directive '%1%'") % line);
      break;
    }
  }

  char * instance_t::split_note(char * line, optional<string>& note)
  {
    if (! *line)
      return line;

    for (char * p = line + 1; *p; p++) {
      if (*p == ';' && (*(p - 1) == ' ' || *(p - 1) == '\t')) {
        *p = '\0';
        char * text = skip_ws(p + 1);
        if (*text)
          note = string(text);
        break;
      }
    }
    return trim_ws(line);
  }

  string instance_t::parse_payee(const char * text)
  {
    string payee(text);
    if (payee.empty())
      throw parse_error(_("Entry lacks a description"));
    return payee;
  }

  amount_t instance_t::parse_amount_field(char * text)
  {
    if (! text || ! *text)
      throw parse_error(_("Entry lacks an amount"));

    if (char * extra = next_element(text, true))
      throw_(parse_error, _f("Unexpected text after amount: %1%") % extra);

    return amount_t(string(text));
  }

  position_t instance_t::here() const
  {
    position_t pos;
    pos.pathname = context.pathname;
    pos.beg_line = context.linenum;
    return pos;
  }

  void instance_t::xact_directive(char * line)
  {
    TRACE_START(xacts, 1, "Time spent handling transactions:");

    optional<string> note;
    line = split_note(line, note);

    char * next = next_element(line);
    if (! next)
      throw parse_error(_("Transaction lacks a description"));

    date_t when = parse_date(line);

    char * amount_field = next_element(next, true);
    string payee(parse_payee(next));

    std::unique_ptr<xact_t> xact(new xact_t(when, payee,
                                            parse_amount_field(amount_field)));
    xact->note = note;
    xact->pos  = here();

    DEBUG("textual.parse", "transaction on " << when << ": " << payee
          << " " << xact->amount.to_fullstring());

    journal.add_xact(xact.get());
    xact.release();
    context.count++;

    TRACE_STOP(xacts, 1);
  }

  void instance_t::period_xact_directive(char * line)
  {
    optional<string> note;
    char * expr = split_note(skip_ws(line + 1), note);

    char * payee_field = next_element(expr, true);
    if (! payee_field)
      throw parse_error(_("Periodic transaction lacks a description"));

    char * amount_field = next_element(payee_field, true);
    string payee(parse_payee(payee_field));

    std::unique_ptr<period_xact_t>
      xact(new period_xact_t(string(expr), payee,
                             parse_amount_field(amount_field)));
    xact->note = note;
    xact->pos  = here();

    DEBUG("textual.parse", "periodic transaction '" << xact->period_string
          << "': " << payee);

    journal.add_period_xact(xact.get());
    xact.release();
    context.count++;
  }

  bool instance_t::general_directive(char * line)
  {
    char buf[parse_context_t::MAX_LINE + 1];
    std::strcpy(buf, line);

    char * p   = buf;
    char * arg = next_element(buf);

    if (std::strcmp(p, "balance") == 0) {
      if (! arg)
        throw parse_error(_("Balance directive lacks a date"));
      balance_directive(arg);
      return true;
    }
    else if (std::strcmp(p, "goal") == 0) {
      if (! arg)
        throw parse_error(_("Goal directive lacks a date"));
      goal_directive(arg);
      return true;
    }
    return false;
  }

  void instance_t::balance_directive(char * line)
  {
    optional<string> note;
    line = split_note(line, note);

    char * amount_field = next_element(line, true);
    date_t when = parse_date(line);

    std::unique_ptr<balance_snapshot_t>
      snapshot(new balance_snapshot_t(when, parse_amount_field(amount_field)));
    snapshot->note = note;
    snapshot->pos  = here();

    DEBUG("textual.parse", "balance on " << when << " is "
          << snapshot->amount.to_fullstring());

    journal.add_snapshot(snapshot.get());
    snapshot.release();
    context.count++;
  }

  void instance_t::goal_directive(char * line)
  {
    bool enabled = true;
    if (std::strncmp(line, "off", 3) == 0 &&
        (line[3] == ' ' || line[3] == '\t')) {
      enabled = false;
      line    = skip_ws(line + 3);
    }

    optional<string> note;
    line = split_note(line, note);

    char * next = next_element(line);
    if (! next)
      throw parse_error(_("Goal lacks a description"));

    date_t when = parse_date(line);

    char * amount_field = next_element(next, true);
    string payee(parse_payee(next));

    std::unique_ptr<goal_t>
      goal(new goal_t(when, payee, parse_amount_field(amount_field), enabled));
    goal->note = note;
    goal->pos  = here();

    DEBUG("textual.parse", "goal by " << when << ": " << payee
          << (enabled ? "" : " (off)"));

    journal.add_goal(goal.get());
    goal.release();
    context.count++;
  }
}

std::size_t read_textual(journal_t&    journal,
                         std::istream& in,
                         const path&   pathname)
{
  parse_context_t context(in, pathname);

  TRACE_START(parsing_total, 1, "Total time spent parsing text:");
  {
    instance_t instance(journal, context);
    instance.parse();
  }
  TRACE_STOP(parsing_total, 1);

  TRACE_FINISH(xacts, 1);
  TRACE_FINISH(instance_parse, 1); // report per-instance timers
  TRACE_FINISH(parsing_total, 1);

  if (context.errors > 0)
    throw error_count(context.errors, context.last);

  return context.count;
}

namespace {
  void print_note(std::ostream& out, const item_t& item)
  {
    if (item.note)
      out << "  ; " << *item.note;
  }
}

void print_xact(std::ostream& out, const xact_t& xact)
{
  out << format_date(xact.date, FMT_WRITTEN) << ' ' << xact.payee
      << "  " << xact.amount.to_written_string();
  print_note(out, xact);
  out << '\n';
}

void print_period_xact(std::ostream& out, const period_xact_t& xact)
{
  out << "~ " << format_period(xact.rule) << "  " << xact.payee
      << "  " << xact.amount.to_written_string();
  print_note(out, xact);
  out << '\n';
}

void print_snapshot(std::ostream& out, const balance_snapshot_t& snapshot)
{
  out << "balance " << format_date(snapshot.date, FMT_WRITTEN)
      << "  " << snapshot.amount.to_written_string();
  print_note(out, snapshot);
  out << '\n';
}

void print_goal(std::ostream& out, const goal_t& goal)
{
  out << "goal " << (goal.enabled ? "" : "off ")
      << format_date(goal.date, FMT_WRITTEN) << ' ' << goal.payee
      << "  " << goal.amount.to_written_string();
  print_note(out, goal);
  out << '\n';
}

void append_to_journal(const path& pathname, const string& text)
{
  bool needs_newline = false;
  if (exists(pathname) && file_size(pathname) > 0) {
    ifstream in(pathname, std::ios::binary);
    in.seekg(-1, std::ios::end);
    char last = '\n';
    if (in.get(last))
      needs_newline = last != '\n';
  }

  ofstream out(pathname, std::ios::out | std::ios::app);
  if (! out.good())
    throw_(std::runtime_error,
           _f("Cannot write to journal file %1%") % pathname);

  if (needs_newline)
    out << '\n';
  out << text;

  if (! out.good())
    throw_(std::runtime_error,
           _f("Failed writing to journal file %1%") % pathname);

  INFO("Appended " << std::count(text.begin(), text.end(), '\n')
       << " line(s) to " << pathname);
}

void rewrite_journal_line(const path&             pathname,
                          const std::size_t       linenum,
                          const optional<string>& text)
{
  std::vector<string> lines;
  {
    ifstream in(pathname, std::ios::binary);
    if (! in.good())
      throw_(std::runtime_error,
             _f("Could not read journal file %1%") % pathname);

    string line;
    while (std::getline(in, line))
      lines.push_back(line);
  }

  if (linenum < 1 || linenum > lines.size())
    throw_(std::logic_error,
           _f("Journal file %1% has no line %2%") % pathname % linenum);

  if (text) {
    string replacement(*text);
    if (! replacement.empty() && replacement[replacement.size() - 1] == '\n')
      replacement.erase(replacement.size() - 1);
    lines[linenum - 1] = replacement;
  } else {
    lines.erase(lines.begin() + std::ptrdiff_t(linenum - 1));
  }

  // Write beside the journal and rename over it, so that a failed write
  // leaves the original untouched.
  path temp(pathname);
  temp += ".new";
  {
    ofstream out(temp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (! out.good())
      throw_(std::runtime_error,
             _f("Cannot write to journal file %1%") % temp);

    foreach (const string& line, lines)
      out << line << '\n';

    if (! out.good())
      throw_(std::runtime_error,
             _f("Failed writing to journal file %1%") % temp);
  }
  boost::filesystem::rename(temp, pathname);

  INFO((text ? "Replaced" : "Removed") << " line " << linenum
       << " of " << pathname);
}

} // namespace budget
