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

#ifndef QUICIO_ECN_HPP_INCLUDED
#define QUICIO_ECN_HPP_INCLUDED

#include <cstdint>

#include "quicio/config.hpp"

#if QUICIO_USE_IOSTREAM
#include <iosfwd>
#endif

namespace quicio {

	// the Explicit Congestion Notification codepoint of a datagram.
	// unsupported means the ECN bits were not reported (on receive) or
	// must not be set (on send).
	enum class ecn_t : std::uint8_t
	{
		unsupported,
		not_ect,
		ect1,
		ect0,
		ce
	};

	// the ECN field is the two least significant bits of the IPv4 TOS byte
	// and the IPv6 traffic class
	constexpr std::uint8_t ecn_mask = 0x3;

	// maps the two ECN bits of a TOS or traffic class byte to a codepoint.
	// Only the low two bits of \p tos are considered.
	QUICIO_EXPORT ecn_t parse_ecn_header_bits(std::uint8_t tos);

	// returns the value of the two ECN bits for \p e. unsupported maps
	// to Not-ECT (0).
	QUICIO_EXPORT std::uint8_t to_header_bits(ecn_t e);

	// returns a human readable name: "ECN unsupported", "Not-ECT",
	// "ECT(1)", "ECT(0)" or "CE"
	QUICIO_EXPORT char const* ecn_name(ecn_t e);

#if QUICIO_USE_IOSTREAM
	QUICIO_EXPORT std::ostream& operator<<(std::ostream& os, ecn_t e);
#endif
}

#endif
