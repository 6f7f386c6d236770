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
 * @file   session.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The state of one invocation: its options, its journal, and the
 * commands that act on them.
 */
#ifndef _SESSION_H
#define _SESSION_H

#include "journal.h"
#include "option.h"

namespace budget {

class session_t : public noncopyable
{
public:
  typedef void (session_t::*command_t)(const strings_list& args,
                                       std::ostream&       out);

  std::unique_ptr<journal_t> journal;
  option_set_t               options;
  std::list<option_set_t>    saved_options;
  log_level_t                startup_log_level;

  explicit session_t();
  ~session_t();

  /** Where the journal lives: --file, else BUDGET_FILE, else budget.dat. */
  path journal_path() const;

  /** Read the journal file into a fresh journal.  A missing file is an
      empty journal; it is created by the first command that writes. */
  journal_t * read_journal_files();

  /** Apply the options that change global behaviour (logging, date
      formats, display precision, today's date) before a command runs. */
  void normalize_options();

  void push_options() {
    saved_options.push_front(options);
  }
  void pop_options() {
    if (saved_options.empty())
      throw_(std::logic_error, _("No saved options to restore"));
    options = saved_options.front();
    saved_options.pop_front();
  }

  void report_options(std::ostream& out) const {
    options.report(out);
  }

  /** Today, as --now or BUDGET_NOW gives it, else the system clock. */
  date_t today() const;

  /** Commands that never touch the journal. */
  command_t look_for_precommand(const string& verb) const;
  command_t look_for_command(const string& verb) const;

  /**
   * @name Commands
   */
  /*@{*/

  void dates_command(const strings_list& args, std::ostream& out);
  void period_command(const strings_list& args, std::ostream& out);
  void register_command(const strings_list& args, std::ostream& out);
  void balance_command(const strings_list& args, std::ostream& out);
  void transactions_command(const strings_list& args, std::ostream& out);
  void recurring_command(const strings_list& args, std::ostream& out);
  void goals_command(const strings_list& args, std::ostream& out);
  void add_command(const strings_list& args, std::ostream& out);
  void edit_command(const strings_list& args, std::ostream& out);
  void delete_command(const strings_list& args, std::ostream& out);
  void recur_command(const strings_list& args, std::ostream& out);
  void replace_command(const strings_list& args, std::ostream& out);
  void unrecur_command(const strings_list& args, std::ostream& out);
  void goal_command(const strings_list& args, std::ostream& out);
  void toggle_command(const strings_list& args, std::ostream& out);
  void post_command(const strings_list& args, std::ostream& out);

  /*@}*/

private:
  void             apply_log_options();
  optional<date_t> option_date(const char * name) const;
  date_t           default_begin() const;
  date_t           forecast_end() const;
  void             append(const string& text);

  /** Replace the journal line `item' was read from with `text', or drop
      it when `text' is none, then read the journal again. */
  void             rewrite(const item_t& item, const optional<string>& text);
};

} // namespace budget

#endif // _SESSION_H
