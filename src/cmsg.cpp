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
#include "quicio/cmsg.hpp"
#include "quicio/assert.hpp"

#include <algorithm> // for copy

#ifdef QUICIO_WINDOWS
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#include <netinet/udp.h>
#endif

// older glibc headers don't define it, the value is part of the kernel ABI
#if defined QUICIO_LINUX && !defined UDP_SEGMENT
#define UDP_SEGMENT 103
#endif

namespace quicio {

	cmsg_record parse_cmsg(span<char const> const buf, error_code& ec
		, cmsg_layout const& layout)
	{
		cmsg_record ret;
		if (buf.size() < layout.header_size())
		{
			ec = errors::invalid_control_message;
			return ret;
		}

		span<char const> view = buf;
		ret.header.length = aux::read_uint(view, layout.length_size, layout.order);
		ret.header.level = static_cast<int>(static_cast<std::int32_t>(
			aux::read_uint(view, layout.level_size, layout.order)));
		ret.header.type = static_cast<int>(static_cast<std::int32_t>(
			aux::read_uint(view, layout.type_size, layout.order)));

		if (ret.header.length < std::uint64_t(layout.header_size())
			|| ret.header.length > std::uint64_t(buf.size()))
		{
			ec = errors::invalid_control_message;
			return cmsg_record{};
		}

		int const len = int(ret.header.length);
		int const data_start = layout.data_offset();
		if (len > data_start)
			ret.data = buf.subspan(data_start, len - data_start);

		int const next = layout.align_header(len);
		if (next < buf.size())
			ret.remainder = buf.subspan(next);
		return ret;
	}

	void append_cmsg(std::vector<char>& buf, int const level, int const type
		, span<char const> const data, cmsg_layout const& layout)
	{
		int const data_len = int(data.size());
		std::size_t const start = buf.size();
		buf.resize(start + std::size_t(layout.record_space(data_len)), 0);

		span<char> view(buf.data() + start, layout.record_space(data_len));
		aux::write_uint(std::uint64_t(layout.record_size(data_len))
			, layout.length_size, view, layout.order);
		aux::write_uint(static_cast<std::uint32_t>(level), layout.level_size, view, layout.order);
		aux::write_uint(static_cast<std::uint32_t>(type), layout.type_size, view, layout.order);

		std::copy(data.begin(), data.end()
			, buf.begin() + std::ptrdiff_t(start) + layout.data_offset());
	}

	int segment_size_cmsg_level()
	{
		return IPPROTO_UDP;
	}

	int segment_size_cmsg_type()
	{
#if defined QUICIO_LINUX
		return UDP_SEGMENT;
#elif defined QUICIO_WINDOWS
		return UDP_SEND_MSG_SIZE;
#else
		return -1;
#endif
	}

	void append_segment_size(std::vector<char>& buf, std::uint16_t const size
		, cmsg_layout const& layout)
	{
		char payload[2];
		span<char> view(payload);
		aux::write_uint16(size, view, layout.order);
		append_cmsg(buf, segment_size_cmsg_level(), segment_size_cmsg_type()
			, payload, layout);
	}

	void append_ecn(std::vector<char>& buf, ecn_t const e, bool const ipv4
		, cmsg_layout const& layout)
	{
		char payload[4];
		span<char> view(payload);
		aux::write_int32(to_header_bits(e), view, layout.order);
		if (ipv4)
			append_cmsg(buf, IPPROTO_IP, IP_TOS, payload, layout);
		else
			append_cmsg(buf, IPPROTO_IPV6, IPV6_TCLASS, payload, layout);
	}
}
