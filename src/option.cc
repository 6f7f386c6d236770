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

#include "option.h"

namespace budget {

option_t * option_set_t::lookup(const string& name)
{
  string buf;
  foreach (char ch, name) {
    if (ch == '-')
      buf.push_back('_');
    else
      buf.push_back(ch);
  }

  string with_arg(buf + "_");
  foreach (option_t& option, options)
    if (option.is(with_arg.c_str()))
      return &option;

  foreach (option_t& option, options)
    if (option.is(buf.c_str()))
      return &option;

  return NULL;
}

option_t * option_set_t::lookup(const char letter)
{
  foreach (option_t& option, options)
    if (option.is(letter))
      return &option;
  return NULL;
}

option_t& option_set_t::operator[](const char * name)
{
  foreach (option_t& option, options)
    if (option.is(name))
      return option;
  throw_(std::logic_error, _f("Unknown option '%1%'") % name);
  return options.front();       // not reached
}

const option_t& option_set_t::operator[](const char * name) const
{
  foreach (const option_t& option, options)
    if (option.is(name))
      return option;
  throw_(std::logic_error, _f("Unknown option '%1%'") % name);
  return options.front();       // not reached
}

namespace {
  void process_option(const string& whence, option_t& opt,
                      const char * arg, const string& name)
  {
    try {
      opt.on(whence, arg ? optional<string>(string(arg)) : none);
    }
    catch (const std::exception&) {
      if (name[0] == '-')
        add_error_context(_f("While parsing option '%1%'") % name);
      else
        add_error_context(_f("While parsing environment variable '%1%'") % name);
      throw;
    }
  }

  bool looks_like_number(const string& arg)
  {
    return (arg.length() > 1 && arg[0] == '-' &&
            (std::isdigit(static_cast<unsigned char>(arg[1])) ||
             arg[1] == '.' || arg[1] == '$'));
  }
}

bool process_option(const string& whence, const string& name,
                    option_set_t& options, const char * arg,
                    const string& varname)
{
  if (option_t * opt = options.lookup(name)) {
    process_option(whence, *opt, arg, varname);
    return true;
  }
  return false;
}

void process_environment(const char ** envp, const string& tag,
                         option_set_t& options)
{
  const char *      tag_p   = tag.c_str();
  string::size_type tag_len = tag.length();

  assert(tag_p);
  assert(tag_len > 0);

  for (const char ** p = envp; *p; p++) {
    if (std::strlen(*p) >= tag_len && std::strncmp(*p, tag_p, tag_len) == 0) {
      char   buf[8192];
      char * r = buf;
      const char * q;
      for (q = *p + tag_len;
           *q && *q != '=' && r - buf < 8191;
           q++)
        if (*q == '_')
          *r++ = '-';
        else
          *r++ = static_cast<char>(std::tolower(*q));
      *r = '\0';

      if (*q == '=') {
        try {
          string value = string(*p, static_cast<std::string::size_type>(q - *p));
          if (! value.empty())
            process_option(string("$") + buf, string(buf), options, q + 1, value);
        }
        catch (const std::exception&) {
          add_error_context(_f("While parsing environment variable option '%1%':")
                            % *p);
          throw;
        }
      }
    }
  }
}

strings_list process_arguments(strings_list args, option_set_t& options)
{
  bool anywhere = true;

  strings_list remaining;

  for (strings_list::iterator i = args.begin();
       i != args.end();
       i++) {
    DEBUG("option.args", "Examining argument '" << *i << "'");

    // Negative amounts such as -20.50 are arguments, not options.
    if (! anywhere || (*i)[0] != '-' || looks_like_number(*i)) {
      DEBUG("option.args", "  adding to list of real args");
      remaining.push_back(*i);
      continue;
    }

    // --long-option or -s
    if ((*i)[1] == '-') {
      if ((*i)[2] == '\0') {
        DEBUG("option.args", "  it's a --, ending options processing");
        anywhere = false;
        continue;
      }

      DEBUG("option.args", "  it's an option string");

      string       opt_name;
      const char * name  = (*i).c_str() + 2;
      const char * value = NULL;

      if (const char * p = std::strchr(name, '=')) {
        opt_name = string(name, static_cast<std::string::size_type>(p - name));
        value = ++p;
        DEBUG("option.args", "  read option value from option: " << value);
      } else {
        opt_name = name;
      }

      option_t * opt = options.lookup(opt_name);
      if (! opt)
        throw_(option_error, _f("Illegal option --%1%") % name);

      if (opt->wants_arg && ! value) {
        if (++i == args.end())
          throw_(option_error, _f("Missing option argument for --%1%") % name);
        value = (*i).c_str();
        DEBUG("option.args", "  read option value from arg: " << value);
      }
      process_option(string("--") + opt_name, *opt, value,
                     string("--") + opt_name);
    }
    else if ((*i)[1] == '\0') {
      throw_(option_error, _f("illegal option -%1%") % (*i)[0]);
    }
    else {
      DEBUG("option.args", "  single-char option");

      std::list<option_t *> option_queue;

      std::string::size_type x = 1;
      for (char c = (*i)[x]; c != '\0'; x++, c = (*i)[x]) {
        option_t * opt = options.lookup(c);
        if (! opt)
          throw_(option_error, _f("Illegal option -%1%") % c);

        option_queue.push_back(opt);
      }

      string flags(*i);
      foreach (option_t * opt, option_queue) {
        const char * value = NULL;
        if (opt->wants_arg) {
          if (++i == args.end())
            throw_(option_error,
                   _f("Missing option argument for %1%") % flags);
          value = (*i).c_str();
          DEBUG("option.args", "  read option value from arg: " << value);
        }
        process_option(flags, *opt, value, flags);
      }
    }
  }

  return remaining;
}

} // namespace budget
