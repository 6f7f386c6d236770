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

/**
 * @addtogroup data
 */

/**
 * @file   recurrence.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Recurrence rules and the engine that expands them into dates.
 *
 * A recurrence_rule_t describes a repeating obligation: how often it
 * recurs, the anchor date fixing its phase, a stepping interval, and an
 * optional end condition.  The engine turns a rule and an inclusive window
 * into a lazy, restartable range of occurrence dates.  Nothing here knows
 * what day it is; every date comes from the caller.
 */
#ifndef _RECURRENCE_H
#define _RECURRENCE_H

#include "utils.h"
#include "times.h"

namespace budget {

DECLARE_EXCEPTION(invalid_rule_error, std::runtime_error);
DECLARE_EXCEPTION(invalid_window_error, std::logic_error);

/**
 * @name Frequencies
 *
 * Each frequency is its own type, so that the engine's visitors must
 * handle every one of them; adding an alternative to frequency_t without
 * updating each visitor is a compile error.
 */
/*@{*/

struct daily_t {
  bool operator==(const daily_t&) const { return true; }
};
struct weekly_t {
  bool operator==(const weekly_t&) const { return true; }
};
struct monthly_t {
  bool operator==(const monthly_t&) const { return true; }
};
/** The 1st and the 15th of every stepped month. */
struct semi_monthly_t {
  enum { FIRST_DAY = 1, SECOND_DAY = 15 };

  bool operator==(const semi_monthly_t&) const { return true; }
};
struct yearly_t {
  bool operator==(const yearly_t&) const { return true; }
};

typedef std::variant<daily_t, weekly_t, monthly_t,
                     semi_monthly_t, yearly_t> frequency_t;

const char * frequency_name(const frequency_t& frequency);

/*@}*/

/**
 * @name End conditions
 */
/*@{*/

struct never_t {
  bool operator==(const never_t&) const { return true; }
};
struct until_t {
  date_t date;

  explicit until_t(const date_t& _date) : date(_date) {}
  bool operator==(const until_t& other) const { return date == other.date; }
};
struct count_t {
  long n;

  explicit count_t(const long _n) : n(_n) {}
  bool operator==(const count_t& other) const { return n == other.n; }
};

typedef std::variant<never_t, until_t, count_t> end_condition_t;

/*@}*/

/**
 * @class recurrence_rule_t
 *
 * @brief An immutable, validated recurrence rule.
 *
 * Rules are only made through create(), which enforces: the anchor is a
 * real date, interval >= 1, an UNTIL date is not before the anchor, and a
 * COUNT is at least one.  Changing a schedule means making a new rule.
 */
class recurrence_rule_t : public equality_comparable<recurrence_rule_t>
{
  frequency_t     frequency_;
  date_t          anchor_;
  long            interval_;
  end_condition_t end_;

  recurrence_rule_t(const frequency_t&     _frequency,
                    const date_t&          _anchor,
                    const long             _interval,
                    const end_condition_t& _end)
    : frequency_(_frequency), anchor_(_anchor),
      interval_(_interval), end_(_end) {}

public:
  static recurrence_rule_t create(const frequency_t&     frequency,
                                  const date_t&          anchor_date,
                                  const long             interval = 1,
                                  const end_condition_t& end_condition =
                                    never_t());

  const frequency_t& frequency() const {
    return frequency_;
  }
  const date_t& anchor_date() const {
    return anchor_;
  }
  long interval() const {
    return interval_;
  }
  const end_condition_t& end_condition() const {
    return end_;
  }

  bool operator==(const recurrence_rule_t& other) const {
    return (frequency_ == other.frequency_ &&
            anchor_    == other.anchor_ &&
            interval_  == other.interval_ &&
            end_       == other.end_);
  }
};

/**
 * @class occurrence_iterator
 *
 * @brief Walks the occurrences of a rule, one index at a time.
 *
 * The iterator carries its own copy of the rule, so it stays valid after
 * the range that produced it is gone.  A default-constructed iterator is
 * the end of every range.
 */
class occurrence_iterator
  : public boost::iterator_facade<occurrence_iterator, const date_t,
                                  boost::forward_traversal_tag>
{
  optional<recurrence_rule_t> rule;
  long                        index;
  date_t                      current;
  date_t                      last;

public:
  occurrence_iterator() : index(0) {}
  occurrence_iterator(const recurrence_rule_t& _rule,
                      const long               _index,
                      const date_t&            _last);

  long occurrence_index() const {
    return index;
  }

private:
  friend class boost::iterator_core_access;

  void settle();
  void increment();

  bool equal(const occurrence_iterator& other) const {
    if (! rule || ! other.rule)
      return ! rule && ! other.rule;
    return index == other.index;
  }

  const date_t& dereference() const {
    assert(rule);
    return current;
  }
};

/**
 * @class occurrences_t
 *
 * @brief The lazy result of generate_occurrences().
 *
 * Nothing is computed until iteration begins, and every call to begin()
 * starts over from the same first index, so the range can be walked any
 * number of times with identical results.
 */
class occurrences_t
{
  recurrence_rule_t rule;
  long              first_index;
  date_t            last;
  bool              is_empty;

public:
  typedef occurrence_iterator iterator;
  typedef occurrence_iterator const_iterator;

  occurrences_t(const recurrence_rule_t& _rule,
                const long               _first_index,
                const date_t&            _last,
                const bool               _is_empty)
    : rule(_rule), first_index(_first_index),
      last(_last), is_empty(_is_empty) {}

  iterator begin() const {
    if (is_empty)
      return iterator();
    return iterator(rule, first_index, last);
  }
  iterator end() const {
    return iterator();
  }

  bool empty() const {
    return begin() == end();
  }
};

/**
 * Expand `rule' over the inclusive window [window_start, window_end].
 *
 * Every produced date d satisfies the rule's stepping, lies on or after
 * both the rule's first occurrence and `window_start', and on or before
 * both `window_end' and the rule's end condition.  With COUNT(n), only
 * the first n occurrences counted from the anchor exist, however early
 * or late the window is.
 *
 * @throws invalid_window_error if window_end < window_start; the check
 *         happens before anything is produced.
 */
occurrences_t generate_occurrences(const recurrence_rule_t& rule,
                                   const date_t&            window_start,
                                   const date_t&            window_end);

/** The k-th date of the rule's series, ignoring its end condition.  None
    when the date would fall beyond the supported calendar. */
optional<date_t> nth_occurrence(const recurrence_rule_t& rule, const long k);

/** The first date of the rule's series.  This is the anchor, except for
    SEMI_MONTHLY, where it is the 1st of the anchor's month. */
date_t first_occurrence(const recurrence_rule_t& rule);

/** The final occurrence of an UNTIL or COUNT rule; none for NEVER. */
optional<date_t> last_occurrence(const recurrence_rule_t& rule);

/** The first occurrence on or after `date', or none if the rule ended. */
optional<date_t> next_occurrence(const recurrence_rule_t& rule,
                                 const date_t&            date);

} // namespace budget

#endif // _RECURRENCE_H
