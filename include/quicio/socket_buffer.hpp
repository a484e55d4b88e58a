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

#ifndef QUICIO_SOCKET_BUFFER_HPP_INCLUDED
#define QUICIO_SOCKET_BUFFER_HPP_INCLUDED

#include "quicio/config.hpp"
#include "quicio/error_code.hpp"

namespace quicio {

	struct packet_socket_interface;
	struct packet_logger;
	struct settings_pack;

	// the current size of the kernel's receive and send buffers of \p s, as
	// reported by SO_RCVBUF and SO_SNDBUF
	QUICIO_EXPORT int inspect_receive_buffer_size(packet_socket_interface& s
		, error_code& ec);
	QUICIO_EXPORT int inspect_send_buffer_size(packet_socket_interface& s
		, error_code& ec);

	// sets the kernel buffer sizes, bypassing the system wide limit where
	// the process has the privileges for it (SO_RCVBUFFORCE and
	// SO_SNDBUFFORCE on linux). Elsewhere this is the same as SO_RCVBUF and
	// SO_SNDBUF
	QUICIO_EXPORT void force_set_receive_buffer_size(packet_socket_interface& s
		, int bytes, error_code& ec);
	QUICIO_EXPORT void force_set_send_buffer_size(packet_socket_interface& s
		, int bytes, error_code& ec);

	// tries to grow the receive (or send) buffer of \p s to at least
	// \p desired bytes, first within the system limit and then with the
	// forced option. Buffers that are already large enough are left alone.
	// Returns the resulting size. Failing to reach \p desired is logged, not
	// an error. ec is only set if the buffer size can't be read
	QUICIO_EXPORT int set_receive_buffer_size(packet_socket_interface& s
		, int desired, packet_logger& log, error_code& ec);
	QUICIO_EXPORT int set_send_buffer_size(packet_socket_interface& s
		, int desired, packet_logger& log, error_code& ec);

	// applies recv_socket_buffer_size and send_socket_buffer_size from
	// \p sett. Settings of 0 are skipped
	QUICIO_EXPORT void apply_socket_buffer_sizes(packet_socket_interface& s
		, settings_pack const& sett, packet_logger& log, error_code& ec);
}

#endif
