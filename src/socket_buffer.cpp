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
#include "quicio/socket_buffer.hpp"
#include "quicio/packet_socket.hpp"
#include "quicio/settings_pack.hpp"
#include "quicio/logger.hpp"

#ifdef QUICIO_WINDOWS
#include <winsock2.h>
#else
#include <sys/socket.h>
#endif

namespace quicio {

namespace {

	struct buffer_options
	{
		char const* name;
		int option;
		int force_option;
	};

	buffer_options const receive_options{"receive", SO_RCVBUF
#ifdef SO_RCVBUFFORCE
		, SO_RCVBUFFORCE
#else
		, SO_RCVBUF
#endif
	};

	buffer_options const send_options{"send", SO_SNDBUF
#ifdef SO_SNDBUFFORCE
		, SO_SNDBUFFORCE
#else
		, SO_SNDBUF
#endif
	};

	int grow_buffer(packet_socket_interface& s, buffer_options const& opt
		, int const desired, packet_logger& log, error_code& ec)
	{
		ec.clear();
		int const size = s.get_int_option(SOL_SOCKET, opt.option, ec);
		if (ec) return 0;

		if (size >= desired)
		{
#ifndef QUICIO_DISABLE_LOGGING
			if (log.should_log(log_level::debug))
				log.log(log_level::debug, "conn has %s buffer of %d kiB (wanted: at least %d kiB)"
					, opt.name, size / 1024, desired / 1024);
#endif
			return size;
		}

		// whether this took effect is checked by reading the size back
		error_code set_ec;
		s.set_int_option(SOL_SOCKET, opt.option, desired, set_ec);

		int new_size = s.get_int_option(SOL_SOCKET, opt.option, ec);
		if (ec) return 0;

		if (new_size < desired)
		{
			// try again, bypassing the system wide limit
			s.set_int_option(SOL_SOCKET, opt.force_option, desired, set_ec);
			new_size = s.get_int_option(SOL_SOCKET, opt.option, ec);
			if (ec) return 0;
		}

#ifndef QUICIO_DISABLE_LOGGING
		if (new_size == size)
		{
			if (log.should_log(log_level::warning))
				log.log(log_level::warning, "failed to increase %s buffer size "
					"(wanted: %d kiB, got %d kiB): %s", opt.name, desired / 1024
					, new_size / 1024, set_ec ? set_ec.message().c_str() : "no error");
		}
		else if (new_size < desired)
		{
			if (log.should_log(log_level::warning))
				log.log(log_level::warning, "failed to sufficiently increase %s buffer "
					"size (was: %d kiB, wanted: %d kiB, got: %d kiB)", opt.name
					, size / 1024, desired / 1024, new_size / 1024);
		}
		else if (log.should_log(log_level::debug))
		{
			log.log(log_level::debug, "increased %s buffer size to %d kiB"
				, opt.name, new_size / 1024);
		}
#else
		QUICIO_UNUSED(log);
#endif
		return new_size;
	}
}

	int inspect_receive_buffer_size(packet_socket_interface& s, error_code& ec)
	{
		ec.clear();
		return s.get_int_option(SOL_SOCKET, SO_RCVBUF, ec);
	}

	int inspect_send_buffer_size(packet_socket_interface& s, error_code& ec)
	{
		ec.clear();
		return s.get_int_option(SOL_SOCKET, SO_SNDBUF, ec);
	}

	void force_set_receive_buffer_size(packet_socket_interface& s, int const bytes
		, error_code& ec)
	{
		ec.clear();
		s.set_int_option(SOL_SOCKET, receive_options.force_option, bytes, ec);
	}

	void force_set_send_buffer_size(packet_socket_interface& s, int const bytes
		, error_code& ec)
	{
		ec.clear();
		s.set_int_option(SOL_SOCKET, send_options.force_option, bytes, ec);
	}

	int set_receive_buffer_size(packet_socket_interface& s, int const desired
		, packet_logger& log, error_code& ec)
	{
		return grow_buffer(s, receive_options, desired, log, ec);
	}

	int set_send_buffer_size(packet_socket_interface& s, int const desired
		, packet_logger& log, error_code& ec)
	{
		return grow_buffer(s, send_options, desired, log, ec);
	}

	void apply_socket_buffer_sizes(packet_socket_interface& s
		, settings_pack const& sett, packet_logger& log, error_code& ec)
	{
		ec.clear();
		int const recv_size = sett.get_int(settings_pack::recv_socket_buffer_size);
		if (recv_size > 0)
		{
			set_receive_buffer_size(s, recv_size, log, ec);
			if (ec) return;
		}
		int const send_size = sett.get_int(settings_pack::send_socket_buffer_size);
		if (send_size > 0)
		{
			set_send_buffer_size(s, send_size, log, ec);
			if (ec) return;
		}
	}
}
