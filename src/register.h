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
 * @addtogroup report
 */

/**
 * @file   register.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The register: journal rows and projected occurrences, with a
 * running balance.
 *
 * Rows are produced in date order and pushed through a chain of row
 * handlers, each of which may compute, filter, collect or print before
 * passing the row on.  On a single date, balance snapshots come first,
 * then projected rows of recurring entries, then transactions in the
 * order they were written.
 */
#ifndef _REGISTER_H
#define _REGISTER_H

#include "journal.h"

namespace budget {

struct register_row_t
{
  enum kind_t {
    SNAPSHOT,
    PROJECTED,
    POSTED
  };

  kind_t           kind;
  date_t           date;
  string           payee;
  amount_t         amount;
  amount_t         total;
  optional<string> note;
  const item_t *   source;

  register_row_t(const kind_t      _kind,
                 const date_t&     _date,
                 const string&     _payee,
                 const amount_t&   _amount,
                 const item_t *    _source = NULL)
    : kind(_kind), date(_date), payee(_payee), amount(_amount),
      source(_source) {}
};

typedef std::vector<register_row_t> register_rows;

template <typename T>
class item_handler : public noncopyable
{
protected:
  std::shared_ptr<item_handler> handler;

public:
  item_handler() {}
  item_handler(std::shared_ptr<item_handler> _handler) : handler(_handler) {}
  virtual ~item_handler() {}

  virtual void flush() {
    if (handler)
      handler->flush();
  }
  virtual void operator()(T& item) {
    if (handler) {
      check_for_signal();
      (*handler)(item);
    }
  }
};

typedef item_handler<register_row_t>  row_handler;
typedef std::shared_ptr<row_handler>  row_handler_ptr;

/** Keeps the running total, which a snapshot resets to its amount. */
class calc_rows : public row_handler
{
  amount_t total;

public:
  calc_rows(row_handler_ptr handler) : row_handler(handler) {}

  virtual void operator()(register_row_t& row);

  const amount_t& current_total() const {
    return total;
  }
};

/** Passes on only the rows dated on or after `begin'. */
class filter_rows : public row_handler
{
  date_t begin;

public:
  filter_rows(row_handler_ptr handler, const date_t& _begin)
    : row_handler(handler), begin(_begin) {}

  virtual void operator()(register_row_t& row) {
    if (row.date >= begin)
      row_handler::operator()(row);
  }
};

class collect_rows : public row_handler
{
public:
  register_rows rows;

  collect_rows() {}

  virtual void operator()(register_row_t& row) {
    rows.push_back(row);
  }
};

/** Prints rows as fixed columns that fit in `width' characters. */
class format_rows : public row_handler
{
  std::ostream& out;
  std::size_t   width;

public:
  format_rows(std::ostream& _out, const std::size_t _width = 80)
    : out(_out), width(_width) {}

  virtual void operator()(register_row_t& row);
  virtual void flush() {
    out.flush();
  }
};

/**
 * Feed `handler' every row the running balance of [begin, end] depends
 * on: starting from the latest snapshot on or before `begin' (or from the
 * journal's earliest date when there is none) and ending at `end'.
 * Occurrences of recurring entries are projected with the recurrence
 * engine; one is left out when a transaction with the same date, payee
 * and amount shows it was already posted.
 *
 * @throws invalid_window_error if end < begin.
 */
void pass_register_rows(const journal_t& journal,
                        const date_t&    begin,
                        const date_t&    end,
                        row_handler_ptr  handler);

/** Rows dated within [begin, end], each with its running balance. */
register_rows register_report(const journal_t& journal,
                              const date_t&    begin,
                              const date_t&    end);

/** The running balance as of the close of `end'. */
amount_t balance_report(const journal_t& journal,
                        const date_t&    begin,
                        const date_t&    end);

/** Occurrences of recurring entries within [begin, end] that have not
    been posted, as transactions ready to be written. */
std::list<xact_t> pending_occurrences(const journal_t& journal,
                                      const date_t&    begin,
                                      const date_t&    end);

} // namespace budget

#endif // _REGISTER_H
