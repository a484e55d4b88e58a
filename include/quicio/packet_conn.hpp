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

#ifndef QUICIO_PACKET_CONN_HPP_INCLUDED
#define QUICIO_PACKET_CONN_HPP_INCLUDED

#include "quicio/config.hpp"
#include "quicio/capabilities.hpp"
#include "quicio/packet_socket.hpp"
#include "quicio/packet_pool.hpp"
#include "quicio/packet_info.hpp"
#include "quicio/settings_pack.hpp"
#include "quicio/logger.hpp"
#include "quicio/ecn.hpp"
#include "quicio/time.hpp"
#include "quicio/span.hpp"
#include "quicio/error_code.hpp"
#include "quicio/debug.hpp"

#include <array>
#include <atomic>
#include <cstdint>

#include <boost/optional.hpp>

namespace quicio {

	// an incoming datagram. The buffer is owned by the receiver and should
	// be handed back with packet_pool::release() once it's no longer needed
	struct received_packet
	{
		udp::endpoint remote;

		// when the packet was taken out of the receive batch
		time_point receive_time;

		packet_ptr buffer;

		// the ECN bits of the IP header, unsupported if they weren't
		// reported
		ecn_t ecn = ecn_t::unsupported;

		// the destination address and interface. Only set on sockets bound
		// to the unspecified address
		boost::optional<packet_info> info;

		span<char const> payload() const
		{
			if (!buffer) return {};
			return buffer->payload();
		}
	};

	struct packet_conn_params
	{
		// whether the Don't-Fragment bit has been set on the socket. This
		// is negotiated before the packet_conn is created
		bool supports_df = false;

		settings_pack settings;

		// where to log. If null, default_logger() is used
		packet_logger* logger = nullptr;

		// the gates for once-only diagnostics. If null, the process wide
		// gates are used
		diagnostic_gates* gates = nullptr;
	};

	// decodes the ancillary data of a received datagram into the ECN and
	// packet info fields of \p p. Records with an unknown level or type are
	// skipped. A packet info record of the wrong size leaves p.info
	// unset and is logged once per address family and set of gates. A
	// malformed chain sets ec to errors::invalid_control_message
	QUICIO_EXTRA_EXPORT void parse_control_messages(span<char const> control
		, received_packet& p, packet_logger& log, diagnostic_gates& gates
		, error_code& ec);

	// reads and writes datagrams on a packet socket, batching reads and
	// attaching ECN marks, segment sizes and source addresses to writes.
	// At most one thread may call read_packet(). write_packet() may be
	// called from any thread
	struct QUICIO_EXPORT packet_conn : private single_threaded
	{
		// the number of datagrams received by one call into the socket
#if QUICIO_USE_RECVMMSG
		static constexpr int batch_size = 8;
#else
		static constexpr int batch_size = 1;
#endif

		// the size of the ancillary data buffer of each batch slot
		static constexpr int control_buffer_size = 128;

		// negotiates the capabilities of \p s. The socket and the pool must
		// outlive the packet_conn. On failure ec is set and the
		// object must not be used
		packet_conn(packet_socket_interface& s, packet_pool& pool
			, packet_conn_params const& params, error_code& ec);

		// throws system_error on failure
		packet_conn(packet_socket_interface& s, packet_pool& pool
			, packet_conn_params const& params);

		~packet_conn();

		packet_conn(packet_conn const&) = delete;
		packet_conn& operator=(packet_conn const&) = delete;

		// returns the next datagram, reading a new batch from the socket when
		// the current one is used up. On error, ec is set and the
		// returned packet has no buffer
		received_packet read_packet(error_code& ec);

		// sends \p payload to \p to. \p control is ancillary data to include
		// as is (typically packet_info::control_message()). A non-zero
		// \p gso_size requires the gso capability and an ECN mark other than
		// unsupported requires the ecn capability, violating either throws
		// system_error and nothing is sent. Returns the number of bytes
		// sent
		int write_packet(span<char const> payload, udp::endpoint const& to
			, span<char const> control, std::uint16_t gso_size, ecn_t ecn
			, error_code& ec);

		conn_capabilities capabilities() const { return m_caps; }

		// true if the destination address of incoming datagrams is reported
		bool packet_info_enabled() const { return m_packet_info; }

		// after close() read_packet() and write_packet() fail with
		// errors::connection_closed. A read blocked in the socket is only
		// woken up by closing the socket itself
		void close();
		bool is_closed() const { return m_closed.load(); }

		packet_pool& pool() { return m_pool; }

		// the batch cursor. The next datagram is taken from slot
		// read_position(), and a new batch is read when it reaches
		// batch_length()
		int read_position() const { return m_read_pos; }
		int batch_length() const { return m_batch_len; }

	private:

		void init(packet_conn_params const& params, error_code& ec);

		// hands new buffers to the slots whose buffers were passed on to
		// the receiver and resets all slots for a new read
		void refill();

		packet_socket_interface& m_socket;
		packet_pool& m_pool;
		packet_logger& m_logger;
		diagnostic_gates& m_gates;

		conn_capabilities m_caps;
		bool m_packet_info = false;
		std::atomic<bool> m_closed{false};

		std::array<packet_ptr, batch_size> m_buffers;
		std::array<std::array<char, control_buffer_size>, batch_size> m_control;
		std::array<batch_message, batch_size> m_messages;

		// 0 <= m_read_pos <= m_batch_len <= batch_size
		int m_read_pos = 0;
		int m_batch_len = 0;
	};
}

#endif
