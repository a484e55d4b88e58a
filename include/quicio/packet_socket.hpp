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

#ifndef QUICIO_PACKET_SOCKET_HPP_INCLUDED
#define QUICIO_PACKET_SOCKET_HPP_INCLUDED

#include "quicio/config.hpp"
#include "quicio/socket.hpp"
#include "quicio/span.hpp"
#include "quicio/error_code.hpp"

#include <vector>

namespace quicio {

	// one slot of a batched receive. The caller provides the payload and
	// control buffers, the socket fills in the rest
	struct batch_message
	{
		span<char> buffer;
		span<char> control;

		// the sender of the datagram
		udp::endpoint from;

		// the number of bytes written to buffer and control
		int bytes = 0;
		int control_bytes = 0;

		// the msg_flags reported for this message (MSG_TRUNC, MSG_CTRUNC)
		int flags = 0;
	};

	// the operations packet_conn needs from a datagram socket
	struct QUICIO_EXPORT packet_socket_interface
	{
		// receives up to msgs.size() datagrams, blocking until at least one
		// is available. Returns the number of messages filled in. Errors from
		// the operating system are reported in \p ec verbatim
		virtual int read_batch(span<batch_message> msgs, error_code& ec) = 0;

		// sends one datagram with the ancillary data in \p control (which may
		// be empty). Returns the number of payload bytes sent
		virtual int write_message(span<char const> payload
			, span<char const> control, udp::endpoint const& to, error_code& ec) = 0;

		virtual void set_int_option(int level, int name, int value, error_code& ec) = 0;
		virtual int get_int_option(int level, int name, error_code& ec) const = 0;

		virtual udp::endpoint local_endpoint(error_code& ec) const = 0;

	protected:
		~packet_socket_interface() = default;
	};

#ifndef QUICIO_WINDOWS

	// packet_socket_interface on top of an asio UDP socket, using
	// recvmmsg()/recvmsg() and sendmsg() on its native handle. The socket
	// must outlive this object. Calls block unless the socket's native handle
	// has been put in non-blocking mode.
	struct QUICIO_EXPORT udp_packet_socket final : packet_socket_interface
	{
		explicit udp_packet_socket(udp::socket& s);

		int read_batch(span<batch_message> msgs, error_code& ec) override;
		int write_message(span<char const> payload
			, span<char const> control, udp::endpoint const& to, error_code& ec) override;

		void set_int_option(int level, int name, int value, error_code& ec) override;
		int get_int_option(int level, int name, error_code& ec) const override;

		udp::endpoint local_endpoint(error_code& ec) const override;

		udp::socket& socket() { return m_socket; }

	private:

		int read_one(batch_message& msg, error_code& ec);

		udp::socket& m_socket;
	};

#endif // QUICIO_WINDOWS
}

#endif
