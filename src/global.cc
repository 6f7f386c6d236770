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

#include "global.h"
#include "session.h"
#include "textual.h"

namespace budget {

std::string _init_file;

global_scope_t::global_scope_t(char ** envp)
  : session_ptr(new session_t), depth(1)
{
  // Read the user's options, in the following order:
  //
  //  1. initialization file (~/.budgetrc)
  //  2. environment variables (BUDGET_<option>)
  //  3. command-line (--option or -o)
  //
  // Each one overrides what the one before it set.
  read_init();
  read_environment_settings(envp);
}

global_scope_t::~global_scope_t()
{
}

void global_scope_t::parse_init(path init_file)
{
  TRACE_START(init, 1, "Read initialization file");

  ifstream in(init_file);
  if (! in.good())
    throw_(parse_error, _f("Could not read init file %1%") % init_file);

  std::size_t linenum = 0;
  string      line;
  while (std::getline(in, line)) {
    ++linenum;

    std::vector<char> buf(line.begin(), line.end());
    buf.push_back('\0');

    char * p = trim_ws(&buf[0]);
    if (! *p || *p == ';' || *p == '#' || *p == '%' || *p == '*' || *p == '|')
      continue;

    try {
      if (*p != '-')
        throw_(parse_error, _("Only options may appear in an init file"));

      strings_list rest = process_arguments(split_arguments(p),
                                            session().options);
      if (! rest.empty())
        throw_(parse_error,
               _f("Unexpected argument '%1%' in init file") % rest.front());
    }
    catch (const std::exception&) {
      add_error_context(_f("While parsing init file %1%")
                        % file_context(init_file, linenum));
      add_error_context(line_context(line));
      throw;
    }
  }

  TRACE_FINISH(init, 1);
}

void global_scope_t::read_init()
{
  // if specified on the command line _init_file is filled in
  // handle_debug_options.  If it was specified on the command line fail if
  // the file doesn't exist. If no init file was specified on the
  // command-line then try the default values, but don't fail if there isn't
  // one.
  path init_file;
  if (! _init_file.empty()) {
    init_file = expand_path(_init_file);
    if (! exists(init_file)) {
      throw_(parse_error, _f("Could not find specified init file %1%") % init_file);
    }
  } else {
    // in order, try to read the init file from:
    // - $XDG_CONFIG_HOME/budget/budgetrc
    // - $HOME/.config/budget/budgetrc
    // - $HOME/.budgetrc
    // - ./.budgetrc
    if (const char * xdg_config_home = std::getenv("XDG_CONFIG_HOME")) {
      init_file = (path(xdg_config_home) / "budget" / "budgetrc");
    }
    if (! exists(init_file)) {
      if (const char * home_var = std::getenv("HOME")) {
        init_file = (path(home_var) / ".config" / "budget" / "budgetrc");
        if (! exists(init_file)) {
          init_file = (path(home_var) / ".budgetrc");
        }
      }
      if (! exists(init_file)) {
        init_file = ("./.budgetrc");
      }
    }
  }
  if (exists(init_file)) {
    INFO("Initialization file is " << init_file);
    parse_init(init_file);
  }
}

void global_scope_t::read_environment_settings(char * envp[])
{
  TRACE_START(environment, 1, "Processed environment variables");

  if (envp)
    process_environment(const_cast<const char **>(envp), "BUDGET_",
                        session().options);

  TRACE_FINISH(environment, 1);
}

strings_list global_scope_t::read_command_arguments(strings_list args)
{
  TRACE_START(arguments, 1, "Processed command-line arguments");

  strings_list remaining = process_arguments(args, session().options);

  TRACE_FINISH(arguments, 1);

  return remaining;
}

char * global_scope_t::prompt_string()
{
  static char prompt[32];
  std::size_t i;
  for (i = 0; i < depth && i < 30; i++)
    prompt[i] = ']';
  prompt[i++] = ' ';
  prompt[i]   = '\0';
  return prompt;
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  if (caught_signal == NONE_CAUGHT) {
    // Display any pending error context information
    string context = error_context();
    if (! context.empty())
      std::cerr << context << std::endl;

    std::cerr << _("Error: ") << err.what() << std::endl;
  } else {
    caught_signal = NONE_CAUGHT;
  }
}

void global_scope_t::execute_command(strings_list args, bool at_repl,
                                     std::ostream& out)
{
  // Process the command verb, arguments and options
  if (at_repl) {
    args = read_command_arguments(args);
    if (args.empty())
      return;
  }

  if (session().options["version"]) {
    show_version_info(out);
    return;
  }
  if (session().options["help"] || args.empty()) {
    show_help(out);
    return;
  }

  strings_list::iterator arg  = args.begin();
  string                 verb = *arg++;

  session().normalize_options();

  // A precommand ignores the journal file completely.  For every other
  // command, read the journal now unless the prompt already did.

  session_t::command_t command = session().look_for_precommand(verb);

  if (! command) {
    command = session().look_for_command(verb);
    if (! command)
      throw_(usage_error, _f("Unrecognized command '%1%'") % verb);

    if (! at_repl)
      session().read_journal_files();
  }

  if (session().options["options"])
    session().report_options(out);

  strings_list command_args(arg, args.end());

  INFO_START(command, "Finished executing command");
  (session().*command)(command_args, out);
  INFO_FINISH(command);

  out.flush();
}

int global_scope_t::execute_command_wrapper(strings_list args, bool at_repl,
                                            std::ostream& out)
{
  int status = 1;

  try {
    if (at_repl) {
      session().push_options();
      ++depth;
    }
    execute_command(args, at_repl, out);
    if (at_repl) {
      session().pop_options();
      --depth;
    }

    // If we've reached this point, everything succeeded fine.  Budget uses
    // exceptions to notify of error conditions, so if you're using gdb,
    // just type "catch throw" to find the source point of any error.
    status = 0;
  }
  catch (const std::exception& err) {
    if (at_repl) {
      session().pop_options();
      --depth;
    }
    report_error(err);
  }
  catch (const error_count& errors) {
    if (at_repl) {
      session().pop_options();
      --depth;
    }
    std::cout.flush();
    std::cerr << _f("Error: %1% error(s) while reading the journal")
      % errors.count << std::endl;
  }

  return status;
}

void global_scope_t::show_help(std::ostream& out)
{
  out << _("\
Usage: budget [options] COMMAND [ARGS]\n\
\n\
Commands:\n\
  dates PERIOD                print the occurrences of PERIOD\n\
  period PERIOD               show how PERIOD is read\n\
  register, reg               transactions and projections, with balance\n\
  balance, bal                the running balance at the end of the window\n\
  transactions, xacts         list transactions, numbered\n\
  recurring                   list recurring entries and their next date\n\
  goals                       list savings goals, numbered\n\
  add DATE DESC AMOUNT        record a transaction\n\
  edit N DATE DESC AMOUNT     replace transaction N\n\
  delete N                    remove transaction N\n\
  recur PERIOD DESC AMOUNT    record a recurring entry\n\
  replace N PERIOD DESC AMOUNT\n\
                              replace recurring entry N\n\
  unrecur N                   remove recurring entry N\n\
  goal DATE DESC AMOUNT       record a savings goal\n\
  toggle N                    switch goal N on or off\n\
  post                        record the recurring transactions now due\n\
\n\
With no command, commands are read from standard input until 'quit'.\n\
\n\
Options:\n\
  -f, --file FILE             journal file (default: budget.dat)\n\
  -b, --begin DATE            start of the report window\n\
  -e, --end DATE              end of the report window\n\
      --now DATE              use DATE as today\n\
      --forecast-days N       days past today to project (default: 30)\n\
      --date-format FMT       strftime format for printed dates\n\
      --input-date-format FMT strptime format for dates read\n\
      --precision N           decimal places printed (default: 2)\n\
      --init-file FILE        read options from FILE\n\
      --options               show the options in effect\n\
      --verbose               log progress\n\
      --debug CATEGORY        log debug messages matching CATEGORY\n\
      --trace LEVEL           log trace messages up to LEVEL\n\
      --version               show the version\n\
  -h, --help                  show this text\n");
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    if (argv[i][0] == '-') {
      if (std::strcmp(argv[i], "--verbose") == 0) {
        _log_level = LOG_INFO;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--init-file") == 0) {
        _init_file = argv[i + 1];
        i++;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--debug") == 0) {
#if DEBUG_ON
        _log_level    = LOG_DEBUG;
        _log_category = argv[i + 1];
        i++;
#endif
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--trace") == 0) {
#if TRACING_ON
        _log_level   = LOG_TRACE;
        try {
          _trace_level = boost::lexical_cast<uint16_t>(argv[i + 1]);
        }
        catch (const boost::bad_lexical_cast&) {
          throw std::logic_error(_("Argument to --trace must be an integer"));
        }
        i++;
#endif
      }
    }
  }
}

} // namespace budget
