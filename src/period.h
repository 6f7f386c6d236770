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
 * @file   period.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Reading and writing recurrence rules as period expressions.
 *
 * A period expression is the text form of a recurrence rule, as it
 * appears after `~' in a journal or as an argument on the command line:
 *
 * @code
 *   monthly from 2024/01/31
 *   every 2 weeks from 2024/01/05 for 26 times
 *   semi-monthly every 2 months from 2024/03/01 until 2024/12/31
 * @endcode
 */
#ifndef _PERIOD_H
#define _PERIOD_H

#include "recurrence.h"

namespace budget {

DECLARE_EXCEPTION(period_error, std::runtime_error);

/**
 * Parse a period expression into a validated rule.
 *
 * @throws period_error       for malformed syntax.
 * @throws date_error         for dates that cannot be read.
 * @throws invalid_rule_error when the rule itself is not admissible.
 */
recurrence_rule_t parse_period(const string& str);

/** The canonical expression for `rule'; parse_period() reads it back to
    an equal rule. */
string format_period(const recurrence_rule_t& rule);

/** Writes the lexer's view of `arg' to `out', one token per line. */
void show_period_tokens(std::ostream& out, const string& arg);

} // namespace budget

#endif // _PERIOD_H
