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
 * @file   journal.h
 * @author John Wiegley
 *
 * @ingroup data
 */
#ifndef _JOURNAL_H
#define _JOURNAL_H

#include "utils.h"
#include "times.h"
#include "xact.h"

namespace budget {

typedef std::list<xact_t *>             xacts_list;
typedef std::list<period_xact_t *>      period_xacts_list;
typedef std::list<balance_snapshot_t *> snapshots_list;
typedef std::list<goal_t *>             goals_list;
typedef std::vector<xact_t *>           xacts_vector;

/**
 * @class journal_t
 *
 * @brief Everything read from the journal file, in file order.
 *
 * The journal owns its records and deletes them when it is destroyed.
 */
class journal_t : public noncopyable
{
public:
  struct fileinfo_t
  {
    optional<path> filename;
    uintmax_t      size;
    bool           from_stream;

    fileinfo_t() : size(0), from_stream(true) {}
    fileinfo_t(const path& _filename)
      : filename(_filename), from_stream(false) {
      size = file_size(*filename);
    }
  };

  xacts_list            xacts;
  period_xacts_list     period_xacts;
  snapshots_list        snapshots;
  goals_list            goals;
  std::list<fileinfo_t> sources;
  std::size_t           sequence;

  journal_t() : sequence(0) {}
  ~journal_t();

  void add_xact(xact_t * xact);
  void add_period_xact(period_xact_t * xact);
  void add_snapshot(balance_snapshot_t * snapshot);
  void add_goal(goal_t * goal);

  /** Transactions dated within [begin, end], by date, then file order. */
  xacts_vector xacts_in(const date_t& begin, const date_t& end) const;

  /** The earliest date of any record, or the first occurrence of any
      recurring entry; none for an empty journal. */
  optional<date_t> earliest_date() const;

  bool empty() const {
    return (xacts.empty() && period_xacts.empty() && snapshots.empty() &&
            goals.empty());
  }

  /** Read a journal file, returning the number of records added.
      @throws error_count when any line failed to parse. */
  std::size_t read(const path& pathname);

  bool valid() const;

private:
  void stamp(item_t& item);
};

} // namespace budget

#endif // _JOURNAL_H
