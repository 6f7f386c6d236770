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

#include "xact.h"
#include "period.h"

namespace budget {

bool xact_t::valid() const
{
  if (! is_valid(date)) {
    DEBUG("xact.validate", "xact_t: ! is_valid(date)");
    return false;
  }
  if (payee.empty()) {
    DEBUG("xact.validate", "xact_t: payee.empty()");
    return false;
  }
  if (! amount.valid()) {
    DEBUG("xact.validate", "xact_t: ! amount.valid()");
    return false;
  }
  return true;
}

period_xact_t::period_xact_t(const string&   _period,
                             const string&   _payee,
                             const amount_t& _amount)
  : xact_base_t(_payee, _amount), rule(parse_period(_period)),
    period_string(_period)
{
  DEBUG("xact.period", "Parsed period '" << _period
        << "' as '" << format_period(rule) << "'");
}

string period_xact_t::format_period_string(const recurrence_rule_t& rule)
{
  return format_period(rule);
}

} // namespace budget
