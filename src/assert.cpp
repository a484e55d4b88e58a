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

#include "quicio/assert.hpp"
#include "quicio/version.hpp"

#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <boost/core/demangle.hpp>

#if QUICIO_USE_EXECINFO
#include <execinfo.h>

namespace {

	// backtrace_symbols() produces "binary(symbol+offset) [address]" on
	// linux and "n binary address symbol + offset" on macOS
	std::string frame_name(char const* frame)
	{
		std::string const f = frame;
		std::string::size_type start = f.find('(');
		if (start != std::string::npos) ++start;
		else
		{
			start = f.find("0x");
			if (start != std::string::npos) start = f.find(' ', start);
			start = (start == std::string::npos) ? 0 : start + 1;
		}

		std::string::size_type end = f.find('+', start);
		if (end == std::string::npos) return boost::core::demangle(f.c_str() + start);
		while (end > start && f[end - 1] == ' ') --end;
		return boost::core::demangle(f.substr(start, end - start).c_str());
	}
}

void print_backtrace(char* out, int len, int const max_depth)
{
	void* stack[50];
	int const size = ::backtrace(stack, 50);
	char** symbols = ::backtrace_symbols(stack, size);
	out[0] = '\0';
	if (symbols == nullptr) return;

	// skip the frame of print_backtrace() itself
	for (int i = 1; i < size && len > 0; ++i)
	{
		int const ret = std::snprintf(out, std::size_t(len), "%d: %s\n", i
			, frame_name(symbols[i]).c_str());
		if (ret < 0 || ret >= len) break;
		out += ret;
		len -= ret;
		if (max_depth > 0 && i == max_depth) break;
	}
	std::free(symbols);
}

#else

void print_backtrace(char* out, int const len, int)
{
	std::snprintf(out, std::size_t(len), "<not supported>");
}

#endif

namespace quicio {

	void assert_print(char const* fmt, ...)
	{
		va_list va;
		va_start(va, fmt);
		std::vfprintf(stderr, fmt, va);
		va_end(va);
	}

	void assert_fail(char const* expr, int const line, char const* file
		, char const* function, char const* value, int const kind)
	{
		char stack[8192];
		print_backtrace(stack, sizeof(stack));

		char const* message = kind == 1
			? "a precondition of a quicio function was violated by its caller"
			: "internal invariant violated in quicio " QUICIO_VERSION;

		assert_print("%s\n"
			"file: '%s'\n"
			"line: %d\n"
			"function: %s\n"
			"expression: %s\n"
			"%s%s"
			"stack:\n"
			"%s\n"
			, message, file, line, function, expr
			, value ? value : "", value ? "\n" : ""
			, stack);

		// break into the debugger, if there is one
		std::raise(SIGABRT);
		std::abort();
	}
}
