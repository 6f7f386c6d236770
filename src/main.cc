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

#include "global.h"             // This is where the meat of main() is, which
                                // was moved there for the sake of clarity here
#include "session.h"

using namespace budget;

int main(int argc, char * argv[], char * envp[])
{
  int status = 1;

  // The very first thing we do is handle some very special command-line
  // options, since they affect how the environment is setup:
  //
  //   --verbose           ; turns on logging
  //   --debug CATEGORY    ; turns on debug logging
  //   --trace LEVEL       ; turns on trace logging
  //   --init-file         ; directs budget to use a different init file
  try {
    handle_debug_options(argc, argv);
  }
  catch (const std::exception& err) {
    std::cerr << _("Error: ") << err.what() << std::endl;
    return 1;
  }

  INFO("Budget starting");

  // Initialize global Boost/C++ environment
  std::ios::sync_with_stdio(false);

  std::signal(SIGINT, sigint_handler);
#if !defined(_WIN32) && !defined(__CYGWIN__)
  std::signal(SIGPIPE, sigpipe_handler);
#endif

  times_initialize();
  amount_t::initialize();

  std::unique_ptr<global_scope_t> global_scope;

  try {
    // Create the session object, which maintains nearly all state relating to
    // this invocation of budget.
    global_scope.reset(new global_scope_t(envp));

    // Construct an STL-style argument list from the process command arguments
    strings_list args;
    for (int i = 1; i < argc; i++)
      args.push_back(argv[i]);

    // Look for options and a command verb in the command-line arguments
    args = global_scope->read_command_arguments(args);

    if (global_scope->session().options["version"]) {
      global_scope->show_version_info(std::cout);
      status = 0;
    }
    else if (global_scope->session().options["help"]) {
      global_scope->show_help(std::cout);
      status = 0;
    }
    else if (! args.empty()) {
      // User has invoke a verb at the interactive command-line
      status = global_scope->execute_command_wrapper(args, false);
    }
    else {
      // Commence the REPL by displaying the current budget version
      global_scope->show_version_info(std::cout);

      global_scope->session().normalize_options();
      global_scope->session().read_journal_files();

      while (! std::cin.eof()) {
        std::cout << global_scope->prompt_string();
        std::cout.flush();

        string line;
        if (! std::getline(std::cin, line))
          break;

        std::vector<char> buf(line.begin(), line.end());
        buf.push_back('\0');
        char * p = trim_ws(&buf[0]);

        check_for_signal();

        if (*p && *p != '#') {
          if (std::strcmp(p, "quit") == 0 || std::strcmp(p, "exit") == 0)
            break;
          global_scope->execute_command_wrapper(split_arguments(p), true);
        }
      }

      status = 0;                       // report success
    }
  }
  catch (const std::exception& err) {
    if (global_scope)
      global_scope->report_error(err);
    else
      std::cerr << "Exception during initialization: " << err.what()
                << std::endl;
  }
  catch (const error_count& errors) {
    // used for a "quick" exit, or when the journal held errors
    status = static_cast<int>(errors.count);
    if (status != 0)
      std::cerr << _f("Error: %1% error(s) while reading the journal")
        % errors.count << std::endl;
  }

  global_scope.reset();

  amount_t::shutdown();
  times_shutdown();

  INFO("Budget ended");

  // Return the final status to the operating system, either 1 for error or 0
  // for a successful completion.
  return status;
}
