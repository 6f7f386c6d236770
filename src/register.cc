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

#include "register.h"
#include "unistring.h"

namespace budget {

void calc_rows::operator()(register_row_t& row)
{
  if (row.kind == register_row_t::SNAPSHOT)
    total = row.amount;
  else
    total += row.amount;

  row.total = total;

  row_handler::operator()(row);
}

void format_rows::operator()(register_row_t& row)
{
  const std::size_t fixed_width = 10 + 3 + 2 + 12 + 1 + 12;
  std::size_t payee_width =
    width > fixed_width + 10 ? width - fixed_width - 1 : 10;

  justify(out, format_date(row.date), 10);

  switch (row.kind) {
  case register_row_t::SNAPSHOT:
    out << " = ";
    break;
  case register_row_t::PROJECTED:
    out << " ~ ";
    break;
  case register_row_t::POSTED:
    out << "   ";
    break;
  }

  justify(out, truncate(row.payee, payee_width), int(payee_width));
  out << "  ";
  justify(out, row.amount.to_string(), 12, true);
  out << ' ';
  justify(out, row.total.to_string(), 12, true);
  out << '\n';
}

namespace {
  bool row_less(const register_row_t& left, const register_row_t& right)
  {
    if (left.date != right.date)
      return left.date < right.date;
    return left.kind < right.kind;
  }

  typedef std::multimap<date_t, const xact_t *> posted_map;
}

void pass_register_rows(const journal_t& journal,
                        const date_t&    begin,
                        const date_t&    end,
                        row_handler_ptr  handler)
{
  if (end < begin)
    throw_(invalid_window_error,
           _f("Report ends (%1%) before it begins (%2%)")
           % format_date(end, FMT_WRITTEN) % format_date(begin, FMT_WRITTEN));

  const balance_snapshot_t * base = NULL;
  foreach (const balance_snapshot_t * snapshot, journal.snapshots)
    if (snapshot->date <= begin && (! base || snapshot->date >= base->date))
      base = snapshot;

  date_t from = begin;
  if (base) {
    from = base->date;
  }
  else if (optional<date_t> earliest = journal.earliest_date()) {
    if (*earliest < from)
      from = *earliest;
  }

  DEBUG("register.rows", "Window " << begin << " to " << end
        << ", totals start at " << from
        << (base ? " from a snapshot" : ""));

  register_rows rows;

  foreach (const balance_snapshot_t * snapshot, journal.snapshots) {
    if (snapshot->date < from || snapshot->date > end)
      continue;
    rows.push_back(register_row_t(register_row_t::SNAPSHOT, snapshot->date,
                                  _("Balance"), snapshot->amount, snapshot));
    rows.back().note = snapshot->note;
  }

  xacts_vector xacts(journal.xacts_in(from, end));

  posted_map posted;
  foreach (const xact_t * xact, xacts)
    posted.insert(posted_map::value_type(xact->date, xact));

  foreach (const period_xact_t * xact, journal.period_xacts) {
    foreach (const date_t& when,
             generate_occurrences(xact->rule, from, end)) {
      bool already_posted = false;
      std::pair<posted_map::const_iterator, posted_map::const_iterator>
        range = posted.equal_range(when);
      for (posted_map::const_iterator i = range.first;
           i != range.second; ++i) {
        if ((*i).second->matches(when, xact->payee, xact->amount)) {
          already_posted = true;
          break;
        }
      }

      if (already_posted) {
        DEBUG("register.rows", "Occurrence of " << xact->payee
              << " on " << when << " was posted");
        continue;
      }

      rows.push_back(register_row_t(register_row_t::PROJECTED, when,
                                    xact->payee, xact->amount, xact));
      rows.back().note = xact->note;
    }
  }

  foreach (const xact_t * xact, xacts) {
    rows.push_back(register_row_t(register_row_t::POSTED, xact->date,
                                  xact->payee, xact->amount, xact));
    rows.back().note = xact->note;
  }

  std::stable_sort(rows.begin(), rows.end(), row_less);

  DEBUG("register.rows", "Passing " << rows.size() << " rows");

  foreach (register_row_t& row, rows)
    (*handler)(row);

  handler->flush();
}

register_rows register_report(const journal_t& journal,
                              const date_t&    begin,
                              const date_t&    end)
{
  std::shared_ptr<collect_rows> collector(new collect_rows);

  row_handler_ptr handler(collector);
  handler.reset(new filter_rows(handler, begin));
  handler.reset(new calc_rows(handler));

  pass_register_rows(journal, begin, end, handler);
  return collector->rows;
}

amount_t balance_report(const journal_t& journal,
                        const date_t&    begin,
                        const date_t&    end)
{
  std::shared_ptr<calc_rows> calc(new calc_rows(row_handler_ptr()));
  pass_register_rows(journal, begin, end, calc);
  return calc->current_total();
}

std::list<xact_t> pending_occurrences(const journal_t& journal,
                                      const date_t&    begin,
                                      const date_t&    end)
{
  std::list<xact_t> pending;

  foreach (const register_row_t& row, register_report(journal, begin, end)) {
    if (row.kind != register_row_t::PROJECTED)
      continue;

    const period_xact_t * xact =
      polymorphic_downcast<const period_xact_t *>(row.source);
    pending.push_back(xact->materialize(row.date));
  }
  return pending;
}

} // namespace budget
