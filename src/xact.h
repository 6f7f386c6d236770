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
 * @file   xact.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The records a journal holds.
 *
 * There are three kinds: dated transactions (xact_t), recurring entries
 * that project transactions from a rule (period_xact_t), and balance
 * snapshots that pin the running balance at a date (balance_snapshot_t).
 */
#ifndef _XACT_H
#define _XACT_H

#include "utils.h"
#include "times.h"
#include "amount.h"
#include "recurrence.h"

namespace budget {

struct position_t
{
  path        pathname;
  std::size_t beg_line;
  std::size_t sequence;

  position_t() : beg_line(0), sequence(0) {}
};

/**
 * @class item_t
 *
 * @brief What every journal record shares: where it was read from, and
 * an optional trailing note.
 */
class item_t
{
public:
  optional<string>     note;
  optional<position_t> pos;

  item_t() {}
  virtual ~item_t() {}

  /** A short phrase naming this record in error messages. */
  virtual string description() const = 0;

protected:
  string located(const char * what) const {
    if (pos) {
      std::ostringstream buf;
      buf << _f("%1% at line %2%") % what % pos->beg_line;
      return buf.str();
    }
    return string(_("generated ")) + what;
  }
};

class xact_base_t : public item_t
{
public:
  string   payee;
  amount_t amount;

  xact_base_t() {}
  xact_base_t(const string& _payee, const amount_t& _amount)
    : payee(_payee), amount(_amount) {}
};

class xact_t : public xact_base_t
{
public:
  date_t date;

  xact_t() {}
  xact_t(const date_t& _date, const string& _payee, const amount_t& _amount)
    : xact_base_t(_payee, _amount), date(_date) {}

  virtual string description() const {
    return located(_("transaction"));
  }

  /** True when `date', payee and amount all agree with the arguments. */
  bool matches(const date_t&   _date,
               const string&   _payee,
               const amount_t& _amount) const {
    return date == _date && payee == _payee && amount == _amount;
  }

  bool valid() const;
};

class period_xact_t : public xact_base_t
{
public:
  recurrence_rule_t rule;
  string            period_string;

  period_xact_t(const recurrence_rule_t& _rule,
                const string&            _payee,
                const amount_t&          _amount)
    : xact_base_t(_payee, _amount), rule(_rule),
      period_string(format_period_string(_rule)) {}
  period_xact_t(const string&   _period,
                const string&   _payee,
                const amount_t& _amount);

  virtual string description() const {
    return located(_("periodic transaction"));
  }

  /** The transaction this entry stands for on `when'. */
  xact_t materialize(const date_t& when) const {
    xact_t xact(when, payee, amount);
    xact.note = note;
    return xact;
  }

private:
  static string format_period_string(const recurrence_rule_t& rule);
};

class balance_snapshot_t : public item_t
{
public:
  date_t   date;
  amount_t amount;

  balance_snapshot_t(const date_t& _date, const amount_t& _amount)
    : date(_date), amount(_amount) {}

  virtual string description() const {
    return located(_("balance snapshot"));
  }
};

/**
 * @class goal_t
 *
 * @brief A savings goal: an amount wanted by a target date.  Goals are
 * listed and switched on or off, but never enter the running balance.
 */
class goal_t : public xact_base_t
{
public:
  date_t date;
  bool   enabled;

  goal_t(const date_t& _date, const string& _payee, const amount_t& _amount,
         const bool _enabled = true)
    : xact_base_t(_payee, _amount), date(_date), enabled(_enabled) {}

  virtual string description() const {
    return located(_("goal"));
  }
};

} // namespace budget

#endif // _XACT_H
