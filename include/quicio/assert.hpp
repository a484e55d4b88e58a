/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions
are met:

    * Redistributions of source code must retain the above copyright
      notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above copyright
      notice, this list of conditions and the following disclaimer in
      the documentation and/or other materials provided with the distribution.
    * Neither the name of the author nor the names of its
      contributors may be used to endorse or promote products derived
      from this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
POSSIBILITY OF SUCH DAMAGE.

*/

#ifndef QUICIO_ASSERT_HPP_INCLUDED
#define QUICIO_ASSERT_HPP_INCLUDED

#include "quicio/config.hpp"

#if QUICIO_USE_ASSERTS && QUICIO_USE_IOSTREAM
#include <sstream>
#endif

// writes a backtrace of the calling thread to \p out, one frame per line.
// At most \p max_depth frames are printed, 0 means no limit
QUICIO_EXPORT void print_backtrace(char* out, int len, int max_depth = 0);

namespace quicio {

	// internal
	QUICIO_EXPORT void assert_print(char const* fmt, ...) QUICIO_FORMAT(1,2);

	// prints the failed expression, its location and a backtrace to stderr,
	// then aborts. kind 1 is a precondition violated by the caller
	QUICIO_EXPORT void assert_fail(char const* expr, int line
		, char const* file, char const* function, char const* val, int kind = 0);
}

#if QUICIO_USE_ASSERTS

#define QUICIO_ASSERT_PRECOND(x) \
	do { if (x) {} else quicio::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } while (false)

#define QUICIO_ASSERT(x) \
	do { if (x) {} else quicio::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } while (false)

#define QUICIO_ASSERT_FAIL() \
	quicio::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, nullptr, 0)

#if QUICIO_USE_IOSTREAM
#define QUICIO_ASSERT_VAL(x, y) \
	do { if (x) {} else { std::stringstream s_; s_ << #y ": " << y; \
	quicio::assert_fail(#x, __LINE__, __FILE__, __func__, s_.str().c_str(), 0); } } while (false)

#define QUICIO_ASSERT_FAIL_VAL(y) \
	do { std::stringstream s_; s_ << #y ": " << y; \
	quicio::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, s_.str().c_str(), 0); } while (false)
#else
#define QUICIO_ASSERT_VAL(x, y) QUICIO_ASSERT(x)
#define QUICIO_ASSERT_FAIL_VAL(y) QUICIO_ASSERT_FAIL()
#endif

#else // QUICIO_USE_ASSERTS

#define QUICIO_ASSERT_PRECOND(a) do {} while (false)
#define QUICIO_ASSERT(a) do {} while (false)
#define QUICIO_ASSERT_VAL(a, b) do {} while (false)
#define QUICIO_ASSERT_FAIL_VAL(a) do {} while (false)
#define QUICIO_ASSERT_FAIL() do {} while (false)

#endif // QUICIO_USE_ASSERTS

#endif // QUICIO_ASSERT_HPP_INCLUDED
