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

#include "quicio/config.hpp"
#include "quicio/logger.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib> // for getenv
#include <cstring>
#include <initializer_list>

namespace quicio {

	char const* log_level_name(log_level const l)
	{
		switch (l)
		{
			case log_level::debug: return "debug";
			case log_level::info: return "info";
			case log_level::warning: return "warning";
			case log_level::error: return "error";
			case log_level::none: return "none";
		}
		return "";
	}

	log_level parse_log_level(char const* str, log_level const def)
	{
		if (str == nullptr) return def;
		for (log_level const l : {log_level::debug, log_level::info
			, log_level::warning, log_level::error, log_level::none})
		{
			if (std::strcmp(str, log_level_name(l)) == 0) return l;
		}
		return def;
	}

	bool stderr_logger::should_log(log_level const l) const
	{
		log_level const t = m_threshold.load();
		return l != log_level::none && t != log_level::none && l >= t;
	}

	QUICIO_FORMAT(3,4)
	void stderr_logger::log(log_level const l, char const* fmt, ...) const
	{
		if (!should_log(l)) return;

		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);

		std::fprintf(stderr, "[quicio] %s: %s\n", log_level_name(l), buf);
	}

	stderr_logger& default_logger()
	{
		static stderr_logger instance(parse_log_level(
			std::getenv("QUICIO_LOG_LEVEL"), log_level::info));
		return instance;
	}

	diagnostic_gates& process_diagnostic_gates()
	{
		static diagnostic_gates gates;
		return gates;
	}
}
