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
 * @addtogroup util
 */

/**
 * @file   option.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief Command-line, environment and init-file options.
 *
 * An option is named the way it is spelled on the command line, with
 * dashes written as underscores; a trailing underscore means it takes an
 * argument.  "forecast_days_" is `--forecast-days N'.
 */
#ifndef _OPTION_H
#define _OPTION_H

#include "utils.h"

namespace budget {

DECLARE_EXCEPTION(option_error, std::runtime_error);

class option_t
{
protected:
  const char *      name;
  string::size_type name_len;
  char              ch;
  bool              handled;
  optional<string>  source;

public:
  string value;
  bool   wants_arg;

  option_t(const char * _name, const char _ch = '\0')
    : name(_name), name_len(std::strlen(name)), ch(_ch), handled(false),
      value(), wants_arg(name_len > 0 ? name[name_len - 1] == '_' : false) {
    DEBUG("option.names", "Option: " << name);
  }

  void report(std::ostream& out) const {
    if (handled && source) {
      out.width(24);
      out << std::right << desc();
      if (wants_arg) {
        out << " = ";
        out.width(42);
        out << std::left << value;
      } else {
        out.width(45);
        out << ' ';
      }
      out << std::left << *source << std::endl;
    }
  }

  string desc() const {
    std::ostringstream out;
    out << "--";
    for (const char * p = name; *p; p++) {
      if (*p == '_') {
        if (*(p + 1))
          out << '-';
      } else {
        out << *p;
      }
    }
    if (ch)
      out << " (-" << ch << ")";
    return out.str();
  }

  bool is(const char * _name) const {
    return std::strcmp(name, _name) == 0;
  }
  bool is(const char letter) const {
    return ch != '\0' && ch == letter;
  }

  operator bool() const {
    return handled;
  }

  /** The argument; an option that was never given yields its default. */
  string str() const {
    if (value.empty())
      throw_(std::runtime_error, _f("No argument provided for %1%") % desc());
    return value;
  }

  void on(const string& whence, const optional<string>& arg = none) {
    if (wants_arg) {
      if (! arg)
        throw_(option_error, _f("Missing option argument for %1%") % desc());
      value = *arg;
    }
    handled = true;
    source  = whence;
  }

  void off() {
    handled = false;
    value   = "";
    source  = none;
  }
};

/**
 * @class option_set_t
 *
 * @brief A copyable collection of options, so that a command run from the
 * interactive prompt can change options just for itself.
 */
class option_set_t
{
  std::vector<option_t> options;

public:
  void add(const option_t& option) {
    options.push_back(option);
  }

  option_t * lookup(const string& name);
  option_t * lookup(const char letter);

  /** The option named `name' (with underscores, as declared); asking for
      an undeclared option is a programming error. */
  option_t& operator[](const char * name);
  const option_t& operator[](const char * name) const;

  void report(std::ostream& out) const {
    foreach (const option_t& option, options)
      option.report(out);
  }
};

bool process_option(const string& whence, const string& name,
                    option_set_t& options, const char * arg,
                    const string& varname);

void process_environment(const char ** envp, const string& tag,
                         option_set_t& options);

strings_list process_arguments(strings_list args, option_set_t& options);

} // namespace budget

#endif // _OPTION_H
