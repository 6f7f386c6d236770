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

#include "period.h"

namespace budget {

class period_parser_t
{
  friend void show_period_tokens(std::ostream& out, const string& arg);

  class lexer_t
  {
    friend class period_parser_t;

    string::const_iterator begin;
    string::const_iterator end;

  public:
    struct token_t
    {
      enum kind_t {
        UNKNOWN,

        TOK_DATE,
        TOK_INT,
        TOK_DASH,

        TOK_SINCE,
        TOK_UNTIL,
        TOK_FOR,
        TOK_TIMES,
        TOK_EVERY,
        TOK_OTHER,
        TOK_SEMI,
        TOK_TWICE,

        TOK_YEAR,
        TOK_QUARTER,
        TOK_MONTH,
        TOK_FORTNIGHT,
        TOK_WEEK,
        TOK_DAY,

        TOK_YEARLY,
        TOK_QUARTERLY,
        TOK_BIMONTHLY,
        TOK_SEMIMONTHLY,
        TOK_MONTHLY,
        TOK_BIWEEKLY,
        TOK_WEEKLY,
        TOK_DAILY,
        TOK_SEMIANNUALLY,

        TOK_YEARS,
        TOK_QUARTERS,
        TOK_MONTHS,
        TOK_FORTNIGHTS,
        TOK_WEEKS,
        TOK_DAYS,

        END_REACHED

      } kind;

      typedef std::variant<string, long, date_t> content_t;

      content_t value;

      explicit token_t(kind_t _kind = UNKNOWN,
                       const content_t& _value = content_t(empty_string))
        : kind(_kind), value(_value) {}

      operator bool() const {
        return kind != END_REACHED;
      }

      string to_string() const {
        std::ostringstream out;

        switch (kind) {
        case UNKNOWN:
          out << std::get<string>(value);
          break;
        case TOK_DATE:
          return format_date(std::get<date_t>(value), FMT_WRITTEN);
        case TOK_INT:
          out << std::get<long>(value);
          break;
        case TOK_DASH:         return "-";
        case TOK_SINCE:        return "from";
        case TOK_UNTIL:        return "until";
        case TOK_FOR:          return "for";
        case TOK_TIMES:        return "times";
        case TOK_EVERY:        return "every";
        case TOK_OTHER:        return "other";
        case TOK_SEMI:         return "semi";
        case TOK_TWICE:        return "twice";
        case TOK_YEAR:         return "year";
        case TOK_QUARTER:      return "quarter";
        case TOK_MONTH:        return "month";
        case TOK_FORTNIGHT:    return "fortnight";
        case TOK_WEEK:         return "week";
        case TOK_DAY:          return "day";
        case TOK_YEARLY:       return "yearly";
        case TOK_QUARTERLY:    return "quarterly";
        case TOK_BIMONTHLY:    return "bimonthly";
        case TOK_SEMIMONTHLY:  return "semimonthly";
        case TOK_MONTHLY:      return "monthly";
        case TOK_BIWEEKLY:     return "biweekly";
        case TOK_WEEKLY:       return "weekly";
        case TOK_DAILY:        return "daily";
        case TOK_SEMIANNUALLY: return "semiannually";
        case TOK_YEARS:        return "years";
        case TOK_QUARTERS:     return "quarters";
        case TOK_MONTHS:       return "months";
        case TOK_FORTNIGHTS:   return "fortnights";
        case TOK_WEEKS:        return "weeks";
        case TOK_DAYS:         return "days";
        case END_REACHED:      return "<EOF>";
        }

        return out.str();
      }

      void dump(std::ostream& out) const {
        switch (kind) {
        case UNKNOWN:          out << "UNKNOWN"; break;
        case TOK_DATE:         out << "TOK_DATE"; break;
        case TOK_INT:          out << "TOK_INT"; break;
        case TOK_DASH:         out << "TOK_DASH"; break;
        case TOK_SINCE:        out << "TOK_SINCE"; break;
        case TOK_UNTIL:        out << "TOK_UNTIL"; break;
        case TOK_FOR:          out << "TOK_FOR"; break;
        case TOK_TIMES:        out << "TOK_TIMES"; break;
        case TOK_EVERY:        out << "TOK_EVERY"; break;
        case TOK_OTHER:        out << "TOK_OTHER"; break;
        case TOK_SEMI:         out << "TOK_SEMI"; break;
        case TOK_TWICE:        out << "TOK_TWICE"; break;
        case TOK_YEAR:         out << "TOK_YEAR"; break;
        case TOK_QUARTER:      out << "TOK_QUARTER"; break;
        case TOK_MONTH:        out << "TOK_MONTH"; break;
        case TOK_FORTNIGHT:    out << "TOK_FORTNIGHT"; break;
        case TOK_WEEK:         out << "TOK_WEEK"; break;
        case TOK_DAY:          out << "TOK_DAY"; break;
        case TOK_YEARLY:       out << "TOK_YEARLY"; break;
        case TOK_QUARTERLY:    out << "TOK_QUARTERLY"; break;
        case TOK_BIMONTHLY:    out << "TOK_BIMONTHLY"; break;
        case TOK_SEMIMONTHLY:  out << "TOK_SEMIMONTHLY"; break;
        case TOK_MONTHLY:      out << "TOK_MONTHLY"; break;
        case TOK_BIWEEKLY:     out << "TOK_BIWEEKLY"; break;
        case TOK_WEEKLY:       out << "TOK_WEEKLY"; break;
        case TOK_DAILY:        out << "TOK_DAILY"; break;
        case TOK_SEMIANNUALLY: out << "TOK_SEMIANNUALLY"; break;
        case TOK_YEARS:        out << "TOK_YEARS"; break;
        case TOK_QUARTERS:     out << "TOK_QUARTERS"; break;
        case TOK_MONTHS:       out << "TOK_MONTHS"; break;
        case TOK_FORTNIGHTS:   out << "TOK_FORTNIGHTS"; break;
        case TOK_WEEKS:        out << "TOK_WEEKS"; break;
        case TOK_DAYS:         out << "TOK_DAYS"; break;
        case END_REACHED:      out << "END_REACHED"; break;
        }
      }

      void unexpected() const;
      static void expected(char wanted, char c = '\0');
    };

    token_t token_cache;

    lexer_t(string::const_iterator _begin,
            string::const_iterator _end)
      : begin(_begin), end(_end) {}

    token_t next_token();
    token_t peek_token() {
      if (token_cache.kind == token_t::UNKNOWN)
        token_cache = next_token();
      return token_cache;
    }
  };

  string  arg;
  lexer_t lexer;

  struct cadence_t {
    frequency_t frequency;
    long        interval;

    cadence_t(const frequency_t& _frequency, const long _interval)
      : frequency(_frequency), interval(_interval) {}
  };

  cadence_t parse_cadence();
  cadence_t parse_every();
  long      parse_int();
  date_t    parse_date_token();

public:
  period_parser_t(const string& _arg)
    : arg(_arg), lexer(arg.begin(), arg.end()) {}

  recurrence_rule_t parse();
};

void period_parser_t::lexer_t::token_t::unexpected() const
{
  switch (kind) {
  case END_REACHED:
    throw_(period_error, _("Unexpected end of period expression"));
  default:
    throw_(period_error,
           _f("Unexpected period token '%1%'") % to_string());
  }
}

void period_parser_t::lexer_t::token_t::expected(char wanted, char c)
{
  if (wanted == '\0')
    throw_(period_error, _f("Invalid char '%1%'") % c);
  else
    throw_(period_error, _f("Invalid char '%1%' (wanted '%2%')") % c % wanted);
}

period_parser_t::lexer_t::token_t period_parser_t::lexer_t::next_token()
{
  if (token_cache.kind != token_t::UNKNOWN) {
    token_t tok = token_cache;
    token_cache = token_t();
    return tok;
  }

  while (begin != end && std::isspace(static_cast<unsigned char>(*begin)))
    begin++;

  if (begin == end)
    return token_t(token_t::END_REACHED);

  if (*begin == '-') {
    ++begin;
    return token_t(token_t::TOK_DASH);
  }

  string::const_iterator start = begin;

  // A word starting with a digit is first tried as a whole date, so that
  // "2024/01/31" and any --input-date-format are read in one piece.
  if (std::isdigit(static_cast<unsigned char>(*begin))) {
    string::const_iterator i = begin;
    for (i = begin;
         i != end && ! std::isspace(static_cast<unsigned char>(*i));
         i++) {}
    assert(i != begin);

    string possible_date(start, i);

    try {
      date_t when = parse_date(possible_date);
      begin = i;
      return token_t(token_t::TOK_DATE, token_t::content_t(when));
    }
    catch (date_error&) {
      if (contains(possible_date, "/") ||
          contains(possible_date, "-") ||
          contains(possible_date, "."))
        throw;
    }
  }

  start = begin;

  string term;
  for (; (begin != end &&
          std::isalnum(static_cast<unsigned char>(*begin))); begin++)
    term.push_back(*begin);

  if (! term.empty()) {
    if (std::isdigit(static_cast<unsigned char>(term[0]))) {
      try {
        return token_t(token_t::TOK_INT,
                       token_t::content_t(lexical_cast<long>(term)));
      }
      catch (const bad_lexical_cast&) {
        throw_(period_error, _f("Invalid number '%1%'") % term);
      }
    }

    to_lower(term);

    if (term == _("from") || term == _("since") || term == _("starting"))
      return token_t(token_t::TOK_SINCE);
    else if (term == _("until") || term == _("to") || term == _("through"))
      return token_t(token_t::TOK_UNTIL);
    else if (term == _("for"))
      return token_t(token_t::TOK_FOR);
    else if (term == _("times") || term == _("occurrences"))
      return token_t(token_t::TOK_TIMES);
    else if (term == _("every"))
      return token_t(token_t::TOK_EVERY);
    else if (term == _("other"))
      return token_t(token_t::TOK_OTHER);
    else if (term == _("semi"))
      return token_t(token_t::TOK_SEMI);
    else if (term == _("twice"))
      return token_t(token_t::TOK_TWICE);
    else if (term == _("year"))
      return token_t(token_t::TOK_YEAR);
    else if (term == _("quarter"))
      return token_t(token_t::TOK_QUARTER);
    else if (term == _("month"))
      return token_t(token_t::TOK_MONTH);
    else if (term == _("fortnight"))
      return token_t(token_t::TOK_FORTNIGHT);
    else if (term == _("week"))
      return token_t(token_t::TOK_WEEK);
    else if (term == _("day"))
      return token_t(token_t::TOK_DAY);
    else if (term == _("yearly") || term == _("annually"))
      return token_t(token_t::TOK_YEARLY);
    else if (term == _("quarterly"))
      return token_t(token_t::TOK_QUARTERLY);
    else if (term == _("bimonthly"))
      return token_t(token_t::TOK_BIMONTHLY);
    else if (term == _("semimonthly"))
      return token_t(token_t::TOK_SEMIMONTHLY);
    else if (term == _("monthly"))
      return token_t(token_t::TOK_MONTHLY);
    else if (term == _("biweekly") || term == _("fortnightly"))
      return token_t(token_t::TOK_BIWEEKLY);
    else if (term == _("weekly"))
      return token_t(token_t::TOK_WEEKLY);
    else if (term == _("daily"))
      return token_t(token_t::TOK_DAILY);
    else if (term == _("semiannually"))
      return token_t(token_t::TOK_SEMIANNUALLY);
    else if (term == _("years"))
      return token_t(token_t::TOK_YEARS);
    else if (term == _("quarters"))
      return token_t(token_t::TOK_QUARTERS);
    else if (term == _("months"))
      return token_t(token_t::TOK_MONTHS);
    else if (term == _("fortnights"))
      return token_t(token_t::TOK_FORTNIGHTS);
    else if (term == _("weeks"))
      return token_t(token_t::TOK_WEEKS);
    else if (term == _("days"))
      return token_t(token_t::TOK_DAYS);
  } else {
    token_t::expected('\0', *begin);
  }

  return token_t(token_t::UNKNOWN, token_t::content_t(term));
}

long period_parser_t::parse_int()
{
  lexer_t::token_t tok = lexer.next_token();
  if (tok.kind != lexer_t::token_t::TOK_INT)
    tok.unexpected();
  return std::get<long>(tok.value);
}

date_t period_parser_t::parse_date_token()
{
  lexer_t::token_t tok = lexer.next_token();
  if (tok.kind != lexer_t::token_t::TOK_DATE)
    tok.unexpected();
  return std::get<date_t>(tok.value);
}

namespace {
  long scaled_length(const long length, const long factor)
  {
    if (length > LONG_MAX / factor)
      throw_(period_error,
             _f("Recurrence interval is too large: %1% x %2%")
             % length % factor);
    return length * factor;
  }
}

period_parser_t::cadence_t period_parser_t::parse_every()
{
  typedef lexer_t::token_t token_t;

  long length = 1;

  token_t tok = lexer.next_token();
  if (tok.kind == token_t::TOK_INT) {
    length = std::get<long>(tok.value);
    tok = lexer.next_token();
    switch (tok.kind) {
    case token_t::TOK_YEARS:
    case token_t::TOK_QUARTERS:
    case token_t::TOK_MONTHS:
    case token_t::TOK_FORTNIGHTS:
    case token_t::TOK_WEEKS:
    case token_t::TOK_DAYS:
      break;
    case token_t::TOK_YEAR:
    case token_t::TOK_QUARTER:
    case token_t::TOK_MONTH:
    case token_t::TOK_FORTNIGHT:
    case token_t::TOK_WEEK:
    case token_t::TOK_DAY:
      if (length == 1)
        break;
      // fall through...
    default:
      tok.unexpected();
      break;
    }
  }
  else if (tok.kind == token_t::TOK_OTHER) {
    length = 2;
    tok = lexer.next_token();
    switch (tok.kind) {
    case token_t::TOK_YEAR:
    case token_t::TOK_QUARTER:
    case token_t::TOK_MONTH:
    case token_t::TOK_FORTNIGHT:
    case token_t::TOK_WEEK:
    case token_t::TOK_DAY:
      break;
    default:
      tok.unexpected();
      break;
    }
  }

  switch (tok.kind) {
  case token_t::TOK_DAY:
  case token_t::TOK_DAYS:
    return cadence_t(daily_t(), length);
  case token_t::TOK_WEEK:
  case token_t::TOK_WEEKS:
    return cadence_t(weekly_t(), length);
  case token_t::TOK_FORTNIGHT:
  case token_t::TOK_FORTNIGHTS:
    return cadence_t(weekly_t(), scaled_length(length, 2));
  case token_t::TOK_MONTH:
  case token_t::TOK_MONTHS:
    return cadence_t(monthly_t(), length);
  case token_t::TOK_QUARTER:
  case token_t::TOK_QUARTERS:
    return cadence_t(monthly_t(), scaled_length(length, 3));
  case token_t::TOK_YEAR:
  case token_t::TOK_YEARS:
    return cadence_t(yearly_t(), length);
  default:
    tok.unexpected();
    break;
  }
  return cadence_t(daily_t(), 0);   // not reached
}

period_parser_t::cadence_t period_parser_t::parse_cadence()
{
  typedef lexer_t::token_t token_t;

  token_t tok = lexer.next_token();
  switch (tok.kind) {
  case token_t::TOK_DAILY:
    return cadence_t(daily_t(), 1);
  case token_t::TOK_WEEKLY:
    return cadence_t(weekly_t(), 1);
  case token_t::TOK_BIWEEKLY:
    return cadence_t(weekly_t(), 2);
  case token_t::TOK_MONTHLY:
    return cadence_t(monthly_t(), 1);
  case token_t::TOK_BIMONTHLY:
    return cadence_t(monthly_t(), 2);
  case token_t::TOK_QUARTERLY:
    return cadence_t(monthly_t(), 3);
  case token_t::TOK_SEMIANNUALLY:
    return cadence_t(monthly_t(), 6);
  case token_t::TOK_YEARLY:
    return cadence_t(yearly_t(), 1);

  case token_t::TOK_EVERY:
    return parse_every();

  case token_t::TOK_SEMI:
    if (lexer.peek_token().kind == token_t::TOK_DASH)
      lexer.next_token();
    tok = lexer.next_token();
    if (tok.kind == token_t::TOK_YEARLY)
      return cadence_t(monthly_t(), 6);
    else if (tok.kind != token_t::TOK_MONTHLY)
      tok.unexpected();
    break;

  case token_t::TOK_TWICE:
    tok = lexer.next_token();
    if (tok.kind != token_t::TOK_MONTHLY)
      tok.unexpected();
    break;

  case token_t::TOK_SEMIMONTHLY:
    break;

  default:
    tok.unexpected();
    break;
  }

  // Only semi-monthly cadences reach here; they may skip whole months.
  long interval = 1;
  if (lexer.peek_token().kind == token_t::TOK_EVERY) {
    lexer.next_token();
    tok = lexer.next_token();
    if (tok.kind == token_t::TOK_OTHER) {
      interval = 2;
      tok = lexer.next_token();
      if (tok.kind != token_t::TOK_MONTH)
        tok.unexpected();
    }
    else if (tok.kind == token_t::TOK_INT) {
      interval = std::get<long>(tok.value);
      tok = lexer.next_token();
      if (tok.kind != token_t::TOK_MONTHS &&
          ! (interval == 1 && tok.kind == token_t::TOK_MONTH))
        tok.unexpected();
    }
    else if (tok.kind != token_t::TOK_MONTH) {
      tok.unexpected();
    }
  }
  return cadence_t(semi_monthly_t(), interval);
}

recurrence_rule_t period_parser_t::parse()
{
  typedef lexer_t::token_t token_t;

  DEBUG("period.parse", "Parsing period expression: " << arg);

  cadence_t cadence = parse_cadence();

  token_t tok = lexer.next_token();
  if (tok.kind != token_t::TOK_SINCE)
    tok.unexpected();
  date_t anchor = parse_date_token();

  end_condition_t end_condition = never_t();

  tok = lexer.next_token();
  switch (tok.kind) {
  case token_t::TOK_UNTIL:
    end_condition = until_t(parse_date_token());
    tok = lexer.next_token();
    break;

  case token_t::TOK_FOR:
    end_condition = count_t(parse_int());
    tok = lexer.next_token();
    if (tok.kind == token_t::TOK_TIMES)
      tok = lexer.next_token();
    break;

  default:
    break;
  }

  if (tok.kind != token_t::END_REACHED)
    tok.unexpected();

  DEBUG("period.parse", "Cadence is " << frequency_name(cadence.frequency)
        << " every " << cadence.interval << ", anchored at " << anchor);

  return recurrence_rule_t::create(cadence.frequency, anchor,
                                   cadence.interval, end_condition);
}

recurrence_rule_t parse_period(const string& str)
{
  period_parser_t parser(str);
  return parser.parse();
}

namespace {
  string plural(const long n, const char * unit) {
    std::ostringstream out;
    out << "every " << n << ' ' << unit;
    if (n != 1)
      out << 's';
    return out.str();
  }

  struct cadence_writer
  {
    const long interval;

    explicit cadence_writer(const long _interval) : interval(_interval) {}

    string operator()(const daily_t&) const {
      return interval == 1 ? "daily" : plural(interval, "day");
    }
    string operator()(const weekly_t&) const {
      switch (interval) {
      case 1:  return "weekly";
      case 2:  return "biweekly";
      default: return plural(interval, "week");
      }
    }
    string operator()(const monthly_t&) const {
      switch (interval) {
      case 1:  return "monthly";
      case 2:  return "bimonthly";
      case 3:  return "quarterly";
      case 6:  return "semi-annually";
      default: return plural(interval, "month");
      }
    }
    string operator()(const semi_monthly_t&) const {
      if (interval == 1)
        return "semi-monthly";
      return "semi-monthly " + plural(interval, "month");
    }
    string operator()(const yearly_t&) const {
      return interval == 1 ? "yearly" : plural(interval, "year");
    }
  };

  struct end_writer
  {
    std::ostream& out;

    explicit end_writer(std::ostream& _out) : out(_out) {}

    void operator()(const never_t&) const {}
    void operator()(const until_t& until) const {
      out << " until " << format_date(until.date, FMT_WRITTEN);
    }
    void operator()(const count_t& count) const {
      out << " for " << count.n << " times";
    }
  };
}

string format_period(const recurrence_rule_t& rule)
{
  std::ostringstream out;

  out << std::visit(cadence_writer(rule.interval()), rule.frequency())
      << " from " << format_date(rule.anchor_date(), FMT_WRITTEN);
  std::visit(end_writer(out), rule.end_condition());

  return out.str();
}

void show_period_tokens(std::ostream& out, const string& arg)
{
  period_parser_t::lexer_t lexer(arg.begin(), arg.end());

  out << _("--- Period expression tokens ---") << std::endl;

  period_parser_t::lexer_t::token_t token;
  do {
    token = lexer.next_token();
    token.dump(out);
    out << ": " << token.to_string() << std::endl;
  }
  while (token.kind != period_parser_t::lexer_t::token_t::END_REACHED);
}

} // namespace budget
