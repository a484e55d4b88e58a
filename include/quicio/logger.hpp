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

#ifndef QUICIO_LOGGER_HPP_INCLUDED
#define QUICIO_LOGGER_HPP_INCLUDED

#include <atomic>
#include <cstdint>

#include "quicio/config.hpp"

namespace quicio {

	enum class log_level : std::uint8_t
	{
		debug,
		info,
		warning,
		error,
		// disables all logging when used as a threshold
		none
	};

	// returns "debug", "info", "warning", "error" or "none"
	QUICIO_EXPORT char const* log_level_name(log_level l);

	// parses a level name as returned by log_level_name(). Returns \p def
	// if \p str is null or not a level name
	QUICIO_EXPORT log_level parse_log_level(char const* str, log_level def);

	// the interface packet connections log through. Implement it to route
	// quicio's log messages into the host application's logging
	struct QUICIO_EXPORT packet_logger
	{
		// returns true if messages of level \p l are to be logged. Callers
		// check this before formatting a message
		virtual bool should_log(log_level l) const = 0;
		virtual void log(log_level l, char const* fmt, ...) const QUICIO_FORMAT(3,4) = 0;

	protected:
		~packet_logger() = default;
	};

	// writes one line per message to stderr:
	// [quicio] <level>: <message>
	struct QUICIO_EXPORT stderr_logger final : packet_logger
	{
		explicit stderr_logger(log_level threshold = log_level::info)
			: m_threshold(threshold) {}

		bool should_log(log_level l) const override;
		void log(log_level l, char const* fmt, ...) const override QUICIO_FORMAT(3,4);

		log_level threshold() const { return m_threshold.load(); }
		void set_threshold(log_level l) { m_threshold.store(l); }

	private:
		std::atomic<log_level> m_threshold;
	};

	// the logger used by connections that aren't given one. Its threshold
	// is read from the QUICIO_LOG_LEVEL environment variable the first
	// time it's called, and defaults to info.
	QUICIO_EXPORT stderr_logger& default_logger();

namespace aux {

	// a flag that lets exactly one of any number of concurrent callers
	// through
	struct log_once_flag
	{
		// returns true the first time it's called, false after that
		bool try_acquire() { return !m_done.exchange(true); }
		bool acquired() const { return m_done.load(); }

	private:
		std::atomic<bool> m_done{false};
	};
}

	// gates that limit diagnostics about malformed packet info records to
	// one message per address family
	struct diagnostic_gates
	{
		aux::log_once_flag ipv4;
		aux::log_once_flag ipv6;
	};

	// the gates shared by all connections in the process
	QUICIO_EXPORT diagnostic_gates& process_diagnostic_gates();
}

#endif
