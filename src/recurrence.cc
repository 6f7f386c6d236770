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

#include "recurrence.h"

namespace budget {

namespace {
  // Spans beyond these cannot land inside the supported calendar
  // (1400-01-01 to 9999-12-31), so stepping stops before overflowing.
  const long MAX_DAY_SPAN   = 8600L * 366L;
  const long MAX_MONTH_SPAN = 8600L * 12L;

  optional<date_t> add_days_checked(const date_t& date, const long k,
                                    const long step)
  {
    if (k > 0 && step > MAX_DAY_SPAN / k)
      return none;

    long days = k * step;
    if ((date_t(gregorian::max_date_time) - date).days() < days)
      return none;

    return date + gregorian::days(days);
  }

  optional<date_t> add_months_checked(const date_t&        date,
                                      const long           k,
                                      const long           step,
                                      const unsigned short day)
  {
    if (k > 0 && step > MAX_MONTH_SPAN / k)
      return none;

    long index = (long(date.year()) * 12 + long(date.month()) - 1 +
                  k * step);
    if (index / 12 > 9999)
      return none;

    return clamped_date(index / 12, index % 12 + 1, day);
  }

  struct frequency_name_visitor
  {
    const char * operator()(const daily_t&) const        { return "daily"; }
    const char * operator()(const weekly_t&) const       { return "weekly"; }
    const char * operator()(const monthly_t&) const      { return "monthly"; }
    const char * operator()(const semi_monthly_t&) const { return "semi-monthly"; }
    const char * operator()(const yearly_t&) const       { return "yearly"; }
  };

  /**
   * Computes the k-th date of the unbounded series.  Month and year
   * stepping always starts again from the anchor, so a clamped date
   * (Jan 31 -> Feb 28) never drags the following ones (Mar 31) down.
   */
  struct nth_date_visitor
  {
    const date_t& anchor;
    const long    interval;
    const long    k;

    nth_date_visitor(const date_t& _anchor, const long _interval,
                     const long _k)
      : anchor(_anchor), interval(_interval), k(_k) {}

    optional<date_t> operator()(const daily_t&) const {
      return add_days_checked(anchor, k, interval);
    }
    optional<date_t> operator()(const weekly_t&) const {
      if (interval > MAX_DAY_SPAN / 7)
        return k == 0 ? optional<date_t>(anchor) : none;
      return add_days_checked(anchor, k, interval * 7);
    }
    optional<date_t> operator()(const monthly_t&) const {
      return add_months_checked(anchor, k, interval, anchor.day());
    }
    optional<date_t> operator()(const semi_monthly_t&) const {
      return add_months_checked(anchor, k / 2, interval,
                                k % 2 == 0 ?
                                semi_monthly_t::FIRST_DAY :
                                semi_monthly_t::SECOND_DAY);
    }
    optional<date_t> operator()(const yearly_t&) const {
      if (interval > MAX_MONTH_SPAN / 12)
        return k == 0 ? optional<date_t>(anchor) : none;
      return add_months_checked(anchor, k, interval * 12, anchor.day());
    }
  };

  /**
   * Estimates the index of the first occurrence on or after `date'.  The
   * estimate never overshoots; callers step forward from it.
   */
  struct first_index_visitor
  {
    const date_t& anchor;
    const long    interval;
    const date_t& date;

    first_index_visitor(const date_t& _anchor, const long _interval,
                        const date_t& _date)
      : anchor(_anchor), interval(_interval), date(_date) {}

    long operator()(const daily_t&) const {
      return (date - anchor).days() / interval;
    }
    long operator()(const weekly_t&) const {
      return (date - anchor).days() / 7 / interval;
    }
    long operator()(const monthly_t&) const {
      return months_between(anchor, date) / interval;
    }
    long operator()(const semi_monthly_t&) const {
      return 2 * (months_between(anchor, date) / interval);
    }
    long operator()(const yearly_t&) const {
      return (long(date.year()) - long(anchor.year())) / interval;
    }
  };

  long lower_index(const recurrence_rule_t& rule, const date_t& date)
  {
    if (date <= rule.anchor_date())
      return 0;
    return std::visit(first_index_visitor(rule.anchor_date(),
                                          rule.interval(), date),
                      rule.frequency());
  }

  /** Index of the first occurrence on or after `date', ignoring the end
      condition; none if the series leaves the calendar first. */
  optional<long> first_index_on_or_after(const recurrence_rule_t& rule,
                                         const date_t&            date)
  {
    long k = lower_index(rule, date);
    while (true) {
      optional<date_t> when = nth_occurrence(rule, k);
      if (! when)
        return none;
      if (*when >= date)
        return k;
      ++k;
    }
  }

  /** Index of the last occurrence the supported calendar can hold. */
  long last_calendar_index(const recurrence_rule_t& rule)
  {
    long k = lower_index(rule, date_t(gregorian::max_date_time));
    while (nth_occurrence(rule, k + 1))
      ++k;
    while (k > 0 && ! nth_occurrence(rule, k))
      --k;
    return k;
  }

  optional<long> count_limit(const end_condition_t& end)
  {
    if (const count_t * count = std::get_if<count_t>(&end))
      return count->n;
    return none;
  }
}

const char * frequency_name(const frequency_t& frequency)
{
  return std::visit(frequency_name_visitor(), frequency);
}

recurrence_rule_t recurrence_rule_t::create(const frequency_t&     frequency,
                                            const date_t&          anchor_date,
                                            const long             interval,
                                            const end_condition_t& end_condition)
{
  if (! is_valid(anchor_date))
    throw_(invalid_rule_error, _("Recurrence anchor is not a valid date"));

  if (interval < 1)
    throw_(invalid_rule_error,
           _f("Recurrence interval must be at least 1, not %1%") % interval);

  if (const until_t * until = std::get_if<until_t>(&end_condition)) {
    if (! is_valid(until->date))
      throw_(invalid_rule_error, _("Recurrence end is not a valid date"));
    if (until->date < anchor_date)
      throw_(invalid_rule_error,
             _f("Recurrence ends (%1%) before it begins (%2%)")
             % format_date(until->date, FMT_WRITTEN)
             % format_date(anchor_date, FMT_WRITTEN));
  }
  else if (const count_t * count = std::get_if<count_t>(&end_condition)) {
    if (count->n < 1)
      throw_(invalid_rule_error,
             _f("Recurrence count must be at least 1, not %1%") % count->n);
  }

  return recurrence_rule_t(frequency, anchor_date, interval, end_condition);
}

optional<date_t> nth_occurrence(const recurrence_rule_t& rule, const long k)
{
  assert(k >= 0);
  return std::visit(nth_date_visitor(rule.anchor_date(), rule.interval(), k),
                    rule.frequency());
}

date_t first_occurrence(const recurrence_rule_t& rule)
{
  return *nth_occurrence(rule, 0);
}

optional<date_t> last_occurrence(const recurrence_rule_t& rule)
{
  const end_condition_t& end(rule.end_condition());

  if (const count_t * count = std::get_if<count_t>(&end))
    return nth_occurrence(rule, std::min(count->n - 1,
                                         last_calendar_index(rule)));
  else if (const until_t * until = std::get_if<until_t>(&end)) {
    long k = lower_index(rule, until->date);
    while (true) {
      optional<date_t> next = nth_occurrence(rule, k + 1);
      if (! next || *next > until->date)
        break;
      ++k;
    }
    while (k > 0 && *nth_occurrence(rule, k) > until->date)
      --k;
    return nth_occurrence(rule, k);
  }
  return none;
}

optional<date_t> next_occurrence(const recurrence_rule_t& rule,
                                 const date_t&            date)
{
  optional<long> k = first_index_on_or_after(rule, date);
  if (! k)
    return none;

  if (optional<long> limit = count_limit(rule.end_condition()))
    if (*k >= *limit)
      return none;

  optional<date_t> when = nth_occurrence(rule, *k);
  if (const until_t * until = std::get_if<until_t>(&rule.end_condition()))
    if (*when > until->date)
      return none;

  return when;
}

occurrences_t generate_occurrences(const recurrence_rule_t& rule,
                                   const date_t&            window_start,
                                   const date_t&            window_end)
{
  if (! is_valid(window_start) || ! is_valid(window_end))
    throw_(invalid_window_error, _("Occurrence window needs two valid dates"));

  if (window_end < window_start)
    throw_(invalid_window_error,
           _f("Occurrence window ends (%1%) before it starts (%2%)")
           % format_date(window_end, FMT_WRITTEN)
           % format_date(window_start, FMT_WRITTEN));

  date_t last = window_end;
  if (const until_t * until = std::get_if<until_t>(&rule.end_condition()))
    if (until->date < last)
      last = until->date;

  DEBUG("recurrence.generate",
        frequency_name(rule.frequency()) << " rule anchored at "
        << rule.anchor_date() << " every " << rule.interval()
        << ", window " << window_start << " to " << window_end);

  if (last < window_start) {
    DEBUG("recurrence.generate", "Rule ends before the window opens");
    return occurrences_t(rule, 0, last, true);
  }

  optional<long> first = first_index_on_or_after(rule, window_start);
  if (! first) {
    DEBUG("recurrence.generate", "Series leaves the calendar before window");
    return occurrences_t(rule, 0, last, true);
  }

  if (optional<long> limit = count_limit(rule.end_condition())) {
    if (*first >= *limit) {
      DEBUG("recurrence.generate",
            "All " << *limit << " occurrences precede the window");
      return occurrences_t(rule, 0, last, true);
    }
  }

  DEBUG("recurrence.generate", "First index in window is " << *first);

  return occurrences_t(rule, *first, last, false);
}

occurrence_iterator::occurrence_iterator(const recurrence_rule_t& _rule,
                                         const long               _index,
                                         const date_t&            _last)
  : rule(_rule), index(_index), last(_last)
{
  settle();
}

void occurrence_iterator::settle()
{
  if (optional<long> limit = count_limit(rule->end_condition())) {
    if (index >= *limit) {
      rule = none;
      return;
    }
  }

  optional<date_t> when = nth_occurrence(*rule, index);
  if (! when || *when > last) {
    rule = none;
    return;
  }

  TRACE(2, "occurrence #" << index << " falls on " << *when);
  current = *when;
}

void occurrence_iterator::increment()
{
  assert(rule);
  ++index;
  settle();
}

} // namespace budget
