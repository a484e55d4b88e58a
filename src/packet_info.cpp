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
#include "quicio/packet_info.hpp"
#include "quicio/aux_/io.hpp"

#include <algorithm> // for copy
#include <array>

#ifdef QUICIO_WINDOWS
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#endif

namespace quicio {

namespace {

	// in_pktinfo is { ifindex, spec_dst, addr } everywhere IP_PKTINFO is
	// supported, except on windows where it's { addr, ifindex }.
	// BSDs without IP_PKTINFO report and accept just the address
	// (IP_RECVDSTADDR and IP_SENDSRCADDR)
#if defined QUICIO_WINDOWS
	constexpr int v4_size = 8;
#elif defined IP_PKTINFO
	constexpr int v4_size = 12;
#else
	constexpr int v4_size = 4;
#endif

	void copy_address(span<char const>& view, char* out, int const len)
	{
		std::copy(view.begin(), view.begin() + len, out);
		view = view.subspan(len);
	}
}

	int ipv4_packet_info_size() { return v4_size; }

	boost::optional<packet_info> parse_ipv4_packet_info(span<char const> body)
	{
		if (body.size() != v4_size) return boost::none;

		packet_info ret;
		address_v4::bytes_type b;
		span<char const> view = body;
#if defined QUICIO_WINDOWS
		copy_address(view, reinterpret_cast<char*>(b.data()), 4);
		ret.if_index = aux::read_uint32(view);
#elif defined IP_PKTINFO
		ret.if_index = aux::read_uint32(view);
		// skip ipi_spec_dst, the destination in the header is ipi_addr
		view = view.subspan(4);
		copy_address(view, reinterpret_cast<char*>(b.data()), 4);
#else
		copy_address(view, reinterpret_cast<char*>(b.data()), 4);
#endif
		ret.addr = address_v4(b);
		return ret;
	}

	boost::optional<packet_info> parse_ipv6_packet_info(span<char const> body)
	{
		if (body.size() != ipv6_packet_info_size) return boost::none;

		packet_info ret;
		address_v6::bytes_type b;
		span<char const> view = body;
		copy_address(view, reinterpret_cast<char*>(b.data()), 16);
		ret.if_index = aux::read_uint32(view);
		ret.addr = unmap(address_v6(b));
		return ret;
	}

	void append_packet_info(std::vector<char>& buf, packet_info const& info
		, cmsg_layout const& layout)
	{
		if (is_v4_on_wire(info.addr))
		{
			auto const b = unmap(info.addr).to_v4().to_bytes();
			std::array<char, v4_size> payload{};
			span<char> view(payload);
#if defined QUICIO_WINDOWS
			std::copy(b.begin(), b.end(), view.begin());
			view = view.subspan(4);
			aux::write_uint32(info.if_index, view, layout.order);
			append_cmsg(buf, IPPROTO_IP, IP_PKTINFO, payload, layout);
#elif defined IP_PKTINFO
			aux::write_uint32(info.if_index, view, layout.order);
			// ipi_spec_dst is the source address of the outgoing datagram
			std::copy(b.begin(), b.end(), view.begin());
			append_cmsg(buf, IPPROTO_IP, IP_PKTINFO, payload, layout);
#else
			std::copy(b.begin(), b.end(), view.begin());
			append_cmsg(buf, IPPROTO_IP, IP_SENDSRCADDR, payload, layout);
#endif
		}
		else
		{
			auto const b = info.addr.to_v6().to_bytes();
			std::array<char, ipv6_packet_info_size> payload{};
			span<char> view(payload);
			std::copy(b.begin(), b.end(), view.begin());
			view = view.subspan(16);
			aux::write_uint32(info.if_index, view, layout.order);
			append_cmsg(buf, IPPROTO_IPV6, IPV6_PKTINFO, payload, layout);
		}
	}

	std::vector<char> packet_info::control_message() const
	{
		std::vector<char> ret;
		append_packet_info(ret, *this);
		return ret;
	}
}
