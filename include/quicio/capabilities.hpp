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

#ifndef QUICIO_CAPABILITIES_HPP_INCLUDED
#define QUICIO_CAPABILITIES_HPP_INCLUDED

#include "quicio/config.hpp"
#include "quicio/error_code.hpp"

namespace quicio {

	struct packet_socket_interface;
	struct packet_logger;
	struct settings_pack;

	// the optional features negotiated for a socket. Fixed when the
	// packet_conn is constructed
	struct conn_capabilities
	{
		// the Don't-Fragment bit is set on outgoing datagrams
		bool df = false;

		// UDP segmentation offload. write_packet() accepts a segment size
		bool gso = false;

		// write_packet() accepts an ECN mark
		bool ecn = false;
	};

	// which address families a socket option was enabled for
	struct family_result
	{
		bool v4 = false;
		bool v6 = false;

		bool any() const { return v4 || v6; }
	};

	// the outcome of probing a socket
	struct probe_result
	{
		conn_capabilities caps;

		// reading of the ECN bits of incoming datagrams
		family_result ecn_reporting;

		// reporting of the destination address of incoming datagrams. Only
		// attempted on sockets bound to the unspecified address
		family_result packet_info;
		bool packet_info_enabled = false;
	};

	// sets the segment size option on \p s to \p segment_size and resets it.
	// Returns true if both calls succeed. Always false on platforms without
	// UDP segmentation offload
	QUICIO_EXPORT bool probe_gso(packet_socket_interface& s, int segment_size
		, packet_logger& log);

	// enables reporting of the ECN bits of incoming datagrams for IPv4 and
	// IPv6. If neither can be enabled ec is set to
	// errors::ecn_activation_failed
	QUICIO_EXPORT family_result enable_ecn_reporting(packet_socket_interface& s
		, error_code& ec);

	// enables reporting of the destination address and interface of
	// incoming datagrams for IPv4 and IPv6. If neither can be enabled ec
	// is set to errors::packet_info_activation_failed
	QUICIO_EXPORT family_result enable_packet_info(packet_socket_interface& s
		, error_code& ec);

	// runs all probes on \p s. \p supports_df is passed through as is. Fatal
	// failures are reported in ec
	QUICIO_EXPORT probe_result probe_capabilities(packet_socket_interface& s
		, bool supports_df, settings_pack const& sett, packet_logger& log
		, error_code& ec);
}

#endif
