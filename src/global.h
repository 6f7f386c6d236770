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
 * @file   global.h
 * @author John Wiegley
 *
 * @ingroup report
 */
#ifndef _GLOBAL_H
#define _GLOBAL_H

#include "session.h"

namespace budget {

extern std::string _init_file;

class global_scope_t : public noncopyable
{
  std::unique_ptr<session_t> session_ptr;
  std::size_t                depth;

public:
  global_scope_t(char ** envp);
  ~global_scope_t();

  void         parse_init(path init_file);
  void         read_init();
  void         read_environment_settings(char * envp[]);
  strings_list read_command_arguments(strings_list args);

  char * prompt_string();

  session_t& session() {
    return *session_ptr.get();
  }

  void report_error(const std::exception& err);

  void execute_command(strings_list args, bool at_repl,
                       std::ostream& out = std::cout);
  /**
   * @return 0 if the command ran to completion; 1 if an error was
   *         reported instead.
   */
  int  execute_command_wrapper(strings_list args, bool at_repl,
                               std::ostream& out = std::cout);

  void show_version_info(std::ostream& out) {
    out <<
      "Budget " << Budget_VERSION_MAJOR << '.' << Budget_VERSION_MINOR << '.'
                << Budget_VERSION_PATCH;
    out << _(", a recurring-transaction budgeting tool");
    out << std::endl;
  }

  void show_help(std::ostream& out);
};

void handle_debug_options(int argc, char * argv[]);

} // namespace budget

#endif // _GLOBAL_H
