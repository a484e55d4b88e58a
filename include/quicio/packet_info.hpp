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

#ifndef QUICIO_PACKET_INFO_HPP_INCLUDED
#define QUICIO_PACKET_INFO_HPP_INCLUDED

#include <cstdint>
#include <vector>

#include <boost/optional.hpp>

#include "quicio/config.hpp"
#include "quicio/socket.hpp"
#include "quicio/span.hpp"
#include "quicio/cmsg.hpp"

namespace quicio {

	// the destination address of a received datagram and the index of the
	// interface it arrived on. Only reported on sockets bound to the
	// unspecified address
	struct QUICIO_EXPORT packet_info
	{
		address addr;
		std::uint32_t if_index = 0;

		// returns an ancillary data record that makes a datagram leave from
		// addr on interface if_index. Pass it as the base control
		// data to packet_conn::write_packet() to reply from the address a
		// request arrived on
		std::vector<char> control_message() const;
	};

	// appends the IP_PKTINFO or IPV6_PKTINFO record for \p info to \p buf
	QUICIO_EXPORT void append_packet_info(std::vector<char>& buf
		, packet_info const& info
		, cmsg_layout const& layout = native_cmsg_layout);

	// the size of the payload of IPv4 and IPv6 packet info records on this
	// platform
	QUICIO_EXPORT int ipv4_packet_info_size();
	constexpr int ipv6_packet_info_size = 20;

	// decode the payload of a received packet info record. If the payload
	// does not have the expected size, an empty optional is returned.
	QUICIO_EXPORT boost::optional<packet_info> parse_ipv4_packet_info(
		span<char const> body);
	QUICIO_EXPORT boost::optional<packet_info> parse_ipv6_packet_info(
		span<char const> body);
}

#endif
