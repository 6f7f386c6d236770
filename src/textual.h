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
 * @file   textual.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Reading and writing the plain-text journal file.
 *
 * @code
 *   ; comment (also '#', '%', '|' or '*')
 *   2024/01/05 Groceries  -20.50   ; optional note
 *   ~ monthly from 2024/01/31  Rent  -1200.00
 *   balance 2024/01/01  1000.00
 *   goal 2024/06/01 Vacation  1500.00
 *   goal off 2024/12/01 New bike  800.00
 * @endcode
 *
 * Fields after the date, period or keyword are separated by a tab or by
 * two or more spaces, so descriptions may contain single spaces.
 */
#ifndef _TEXTUAL_H
#define _TEXTUAL_H

#include "journal.h"

namespace budget {

DECLARE_EXCEPTION(parse_error, std::runtime_error);

/**
 * Parse every line of `in' into `journal'.  A line that fails is reported
 * on std::cerr with its file, line number and text, and parsing goes on
 * with the next line.
 *
 * @return the number of records added.
 * @throws error_count if any line failed, after the whole stream is read.
 */
std::size_t read_textual(journal_t&    journal,
                         std::istream& in,
                         const path&   pathname = path());

void print_xact(std::ostream& out, const xact_t& xact);
void print_period_xact(std::ostream& out, const period_xact_t& xact);
void print_snapshot(std::ostream& out, const balance_snapshot_t& snapshot);
void print_goal(std::ostream& out, const goal_t& goal);

/** Append `text', one or more complete lines, to the journal file at
    `pathname', creating the file when it does not exist. */
void append_to_journal(const path& pathname, const string& text);

/** Replace line `linenum' (counted from 1) of the journal at `pathname'
    with `text', or remove the line when `text' is none.
    @throws std::logic_error when the file has no such line. */
void rewrite_journal_line(const path&             pathname,
                          const std::size_t       linenum,
                          const optional<string>& text);

} // namespace budget

#endif // _TEXTUAL_H
