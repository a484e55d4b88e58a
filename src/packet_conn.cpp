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
#include "quicio/packet_conn.hpp"
#include "quicio/cmsg.hpp"
#include "quicio/assert.hpp"
#include "quicio/aux_/throw.hpp"
#include "quicio/aux_/io.hpp"

#include <algorithm> // for min
#include <vector>

#ifdef QUICIO_WINDOWS
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#endif

namespace quicio {

namespace {

	// the type of the record carrying the TOS byte of a received IPv4
	// datagram. Linux reports it as IP_TOS, BSDs as IP_RECVTOS
#if defined QUICIO_LINUX || defined QUICIO_WINDOWS
	constexpr int ipv4_tos_type = IP_TOS;
#else
	constexpr int ipv4_tos_type = IP_RECVTOS;
#endif

#if defined IP_PKTINFO
	constexpr int ipv4_packet_info_type = IP_PKTINFO;
#else
	constexpr int ipv4_packet_info_type = IP_RECVDSTADDR;
#endif

	void log_invalid_packet_info(packet_logger& log, aux::log_once_flag& gate
		, char const* family, int const len)
	{
		if (!gate.try_acquire()) return;
#ifndef QUICIO_DISABLE_LOGGING
		if (log.should_log(log_level::warning))
			log.log(log_level::warning, "received %s packet info with unexpected "
				"length %d", family, len);
#else
		QUICIO_UNUSED(log);
		QUICIO_UNUSED(family);
		QUICIO_UNUSED(len);
#endif
	}
}

	void parse_control_messages(span<char const> control
		, received_packet& p, packet_logger& log, diagnostic_gates& gates
		, error_code& ec)
	{
		ec.clear();
		while (!control.empty())
		{
			cmsg_record const rec = parse_cmsg(control, ec);
			if (ec) return;
			control = rec.remainder;

			if (rec.header.level == IPPROTO_IP)
			{
				if (rec.header.type == ipv4_tos_type)
				{
					if (rec.data.empty()) continue;
					p.ecn = parse_ecn_header_bits(static_cast<std::uint8_t>(rec.data[0]));
				}
				else if (rec.header.type == ipv4_packet_info_type)
				{
					p.info = parse_ipv4_packet_info(rec.data);
					if (!p.info)
						log_invalid_packet_info(log, gates.ipv4, "IPv4", int(rec.data.size()));
				}
			}
			else if (rec.header.level == IPPROTO_IPV6)
			{
				if (rec.header.type == IPV6_TCLASS)
				{
					if (rec.data.empty()) continue;
					std::uint8_t tclass;
					if (rec.data.size() == 4)
					{
						span<char const> view = rec.data;
						tclass = static_cast<std::uint8_t>(aux::read_int32(view));
					}
					else
					{
						tclass = static_cast<std::uint8_t>(rec.data[0]);
					}
					p.ecn = parse_ecn_header_bits(tclass);
				}
				else if (rec.header.type == IPV6_PKTINFO)
				{
					p.info = parse_ipv6_packet_info(rec.data);
					if (!p.info)
						log_invalid_packet_info(log, gates.ipv6, "IPv6", int(rec.data.size()));
				}
			}
		}
	}

	packet_conn::packet_conn(packet_socket_interface& s, packet_pool& pool
		, packet_conn_params const& params, error_code& ec)
		: m_socket(s)
		, m_pool(pool)
		, m_logger(params.logger ? *params.logger : default_logger())
		, m_gates(params.gates ? *params.gates : process_diagnostic_gates())
	{
		init(params, ec);
	}

	packet_conn::packet_conn(packet_socket_interface& s, packet_pool& pool
		, packet_conn_params const& params)
		: m_socket(s)
		, m_pool(pool)
		, m_logger(params.logger ? *params.logger : default_logger())
		, m_gates(params.gates ? *params.gates : process_diagnostic_gates())
	{
		error_code ec;
		init(params, ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	packet_conn::~packet_conn()
	{
		// buffers that were never handed out go back to the pool
		for (auto& b : m_buffers)
			if (b) m_pool.release(std::move(b));
	}

	void packet_conn::init(packet_conn_params const& params, error_code& ec)
	{
		ec.clear();
		probe_result const r = probe_capabilities(m_socket, params.supports_df
			, params.settings, m_logger, ec);
		if (ec) return;

		m_caps = r.caps;
		m_packet_info = r.packet_info_enabled;
	}

	void packet_conn::close()
	{
		m_closed.store(true);
	}

	void packet_conn::refill()
	{
		for (int i = 0; i < batch_size; ++i)
		{
			packet_ptr& b = m_buffers[std::size_t(i)];
			if (!b) b = m_pool.acquire();

			batch_message& m = m_messages[std::size_t(i)];
			m = batch_message();
			m.buffer = b->storage();
			m.control = m_control[std::size_t(i)];
		}
	}

	received_packet packet_conn::read_packet(error_code& ec)
	{
		QUICIO_ASSERT(is_single_thread());
		QUICIO_ASSERT(m_read_pos >= 0);
		QUICIO_ASSERT(m_read_pos <= m_batch_len);

		ec.clear();
		if (m_closed.load())
		{
			ec = errors::connection_closed;
			return {};
		}

		if (m_read_pos == m_batch_len)
		{
			refill();
			m_read_pos = 0;
			m_batch_len = 0;

			int const n = m_socket.read_batch(m_messages, ec);
			if (ec)
			{
				if (m_closed.load()) ec = errors::connection_closed;
				return {};
			}
			// a socket may not report a negative count without an error, but if
			// it does the batch must stay empty
			if (n <= 0)
			{
				ec = errors::empty_batch;
				return {};
			}
			QUICIO_ASSERT_VAL(n <= batch_size, n);
			m_batch_len = std::min(n, batch_size);
		}

		int const idx = m_read_pos++;
		batch_message const& msg = m_messages[std::size_t(idx)];

		received_packet ret;
		ret.remote = msg.from;
		ret.receive_time = clock_type::now();

		int const control_len = std::min(msg.control_bytes, control_buffer_size);
		parse_control_messages({m_control[std::size_t(idx)].data(), control_len}
			, ret, m_logger, m_gates, ec);
		// the buffer stays in its slot and is reused for the next batch
		if (ec) return {};

		packet_ptr& b = m_buffers[std::size_t(idx)];
		b->size = static_cast<std::uint16_t>(std::max(0, std::min(msg.bytes, int(b->allocated))));
		ret.buffer = std::move(b);
		return ret;
	}

	int packet_conn::write_packet(span<char const> const payload
		, udp::endpoint const& to, span<char const> const control
		, std::uint16_t const gso_size, ecn_t const ecn, error_code& ec)
	{
		if (gso_size > 0 && !m_caps.gso)
			aux::throw_ex<system_error>(error_code(errors::gso_not_negotiated));
		if (ecn != ecn_t::unsupported && !m_caps.ecn)
			aux::throw_ex<system_error>(error_code(errors::ecn_not_negotiated));

		ec.clear();
		if (m_closed.load())
		{
			ec = errors::connection_closed;
			return 0;
		}

		std::vector<char> cmsg_buf(control.begin(), control.end());
		if (gso_size > 0)
			append_segment_size(cmsg_buf, gso_size);
		if (ecn != ecn_t::unsupported)
			append_ecn(cmsg_buf, ecn, is_v4_on_wire(to.address()));

		return m_socket.write_message(payload, cmsg_buf, to, ec);
	}
}
