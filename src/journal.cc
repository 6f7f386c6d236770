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

#include "journal.h"
#include "textual.h"

namespace budget {

journal_t::~journal_t()
{
  foreach (xact_t * xact, xacts)
    checked_delete(xact);

  foreach (period_xact_t * xact, period_xacts)
    checked_delete(xact);

  foreach (balance_snapshot_t * snapshot, snapshots)
    checked_delete(snapshot);

  foreach (goal_t * goal, goals)
    checked_delete(goal);
}

void journal_t::stamp(item_t& item)
{
  if (! item.pos)
    item.pos = position_t();
  item.pos->sequence = ++sequence;
}

void journal_t::add_xact(xact_t * xact)
{
  assert(xact);
  if (! xact->valid())
    throw_(std::logic_error,
           _f("Invalid %1% cannot join the journal") % xact->description());

  stamp(*xact);
  xacts.push_back(xact);
}

void journal_t::add_period_xact(period_xact_t * xact)
{
  assert(xact);
  stamp(*xact);
  period_xacts.push_back(xact);
}

void journal_t::add_snapshot(balance_snapshot_t * snapshot)
{
  assert(snapshot);
  stamp(*snapshot);
  snapshots.push_back(snapshot);
}

void journal_t::add_goal(goal_t * goal)
{
  assert(goal);
  stamp(*goal);
  goals.push_back(goal);
}

namespace {
  bool xact_date_less(const xact_t * left, const xact_t * right)
  {
    return left->date < right->date;
  }
}

xacts_vector journal_t::xacts_in(const date_t& begin, const date_t& end) const
{
  xacts_vector result;
  foreach (xact_t * xact, xacts)
    if (xact->date >= begin && xact->date <= end)
      result.push_back(xact);

  // xacts is in file order, so a stable sort keeps same-day entries in
  // the order they were written.
  std::stable_sort(result.begin(), result.end(), xact_date_less);
  return result;
}

optional<date_t> journal_t::earliest_date() const
{
  optional<date_t> earliest;

  foreach (const xact_t * xact, xacts)
    if (! earliest || xact->date < *earliest)
      earliest = xact->date;

  foreach (const period_xact_t * xact, period_xacts) {
    date_t first = first_occurrence(xact->rule);
    if (! earliest || first < *earliest)
      earliest = first;
  }

  foreach (const balance_snapshot_t * snapshot, snapshots)
    if (! earliest || snapshot->date < *earliest)
      earliest = snapshot->date;

  return earliest;
}

std::size_t journal_t::read(const path& pathname)
{
  if (! exists(pathname))
    throw_(std::runtime_error,
           _f("Could not find specified journal file %1%") % pathname);

  ifstream stream(pathname);
  if (! stream.good())
    throw_(std::runtime_error,
           _f("Could not read journal file %1%") % pathname);

  std::size_t count = read_textual(*this, stream, pathname);
  sources.push_back(fileinfo_t(pathname));

  INFO("Read " << count << " records from " << pathname);
  return count;
}

bool journal_t::valid() const
{
  foreach (const xact_t * xact, xacts)
    if (! xact->valid()) {
      DEBUG("journal.validate", "journal_t: xact not valid");
      return false;
    }
  return true;
}

} // namespace budget
