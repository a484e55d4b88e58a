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
#include "quicio/capabilities.hpp"
#include "quicio/packet_socket.hpp"
#include "quicio/settings_pack.hpp"
#include "quicio/logger.hpp"
#include "quicio/cmsg.hpp" // for segment_size_cmsg_type

#ifdef QUICIO_WINDOWS
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#endif

namespace quicio {

namespace {

	char const* families(family_result const r)
	{
		if (r.v4 && r.v6) return "IPv4 and IPv6";
		if (r.v4) return "IPv4";
		if (r.v6) return "IPv6";
		return "no address family";
	}

	int ipv4_packet_info_option()
	{
#if defined IP_RECVPKTINFO
		return IP_RECVPKTINFO;
#elif defined IP_PKTINFO
		return IP_PKTINFO;
#else
		return IP_RECVDSTADDR;
#endif
	}
}

	bool probe_gso(packet_socket_interface& s, int const segment_size
		, packet_logger& log)
	{
#if QUICIO_USE_GSO
		error_code ec;
		s.set_int_option(segment_size_cmsg_level(), segment_size_cmsg_type()
			, segment_size, ec);
		if (ec)
		{
#ifndef QUICIO_DISABLE_LOGGING
			if (log.should_log(log_level::debug))
				log.log(log_level::debug, "GSO probe with segment size %d failed: %s"
					, segment_size, ec.message().c_str());
#endif
			return false;
		}

		// segmentation is requested per datagram by the send path, the socket
		// default must be off
		s.set_int_option(segment_size_cmsg_level(), segment_size_cmsg_type(), 0, ec);
		if (ec)
		{
#ifndef QUICIO_DISABLE_LOGGING
			if (log.should_log(log_level::warning))
				log.log(log_level::warning, "failed to reset the GSO segment size, "
					"disabling GSO: %s", ec.message().c_str());
#endif
			return false;
		}
		return true;
#else
		QUICIO_UNUSED(s);
		QUICIO_UNUSED(segment_size);
		QUICIO_UNUSED(log);
		return false;
#endif
	}

	family_result enable_ecn_reporting(packet_socket_interface& s, error_code& ec)
	{
		ec.clear();
		family_result ret;
		error_code err4;
		s.set_int_option(IPPROTO_IP, IP_RECVTOS, 1, err4);
		ret.v4 = !err4;

		error_code err6;
		s.set_int_option(IPPROTO_IPV6, IPV6_RECVTCLASS, 1, err6);
		ret.v6 = !err6;

		if (!ret.any()) ec = errors::ecn_activation_failed;
		return ret;
	}

	family_result enable_packet_info(packet_socket_interface& s, error_code& ec)
	{
		ec.clear();
		family_result ret;
		error_code err4;
		s.set_int_option(IPPROTO_IP, ipv4_packet_info_option(), 1, err4);
		ret.v4 = !err4;

		error_code err6;
		s.set_int_option(IPPROTO_IPV6, IPV6_RECVPKTINFO, 1, err6);
		ret.v6 = !err6;

		if (!ret.any()) ec = errors::packet_info_activation_failed;
		return ret;
	}

	probe_result probe_capabilities(packet_socket_interface& s
		, bool const supports_df, settings_pack const& sett, packet_logger& log
		, error_code& ec)
	{
		ec.clear();
		probe_result ret;
		ret.caps.df = supports_df;

		ret.ecn_reporting = enable_ecn_reporting(s, ec);
		if (ec) return ret;
#ifndef QUICIO_DISABLE_LOGGING
		if (log.should_log(log_level::debug))
			log.log(log_level::debug, "activating reading of ECN bits for %s"
				, families(ret.ecn_reporting));
#endif

		udp::endpoint const local = s.local_endpoint(ec);
		if (ec) return ret;

		if (local.address().is_unspecified())
		{
			ret.packet_info = enable_packet_info(s, ec);
			if (ec) return ret;
			ret.packet_info_enabled = true;
#ifndef QUICIO_DISABLE_LOGGING
			if (log.should_log(log_level::debug))
				log.log(log_level::debug, "activating packet info for %s"
					, families(ret.packet_info));
#endif
		}

		if (sett.get_bool(settings_pack::disable_gso))
		{
#ifndef QUICIO_DISABLE_LOGGING
			if (log.should_log(log_level::debug))
				log.log(log_level::debug, "GSO disabled by configuration");
#endif
		}
		else
		{
			ret.caps.gso = probe_gso(s, sett.get_int(settings_pack::gso_probe_segment_size), log);
		}

		ret.caps.ecn = !sett.get_bool(settings_pack::disable_ecn);

#ifndef QUICIO_DISABLE_LOGGING
		if (log.should_log(log_level::debug))
			log.log(log_level::debug, "capabilities: DF: %s, GSO: %s, ECN: %s"
				, ret.caps.df ? "yes" : "no"
				, ret.caps.gso ? "yes" : "no"
				, ret.caps.ecn ? "yes" : "no");
#endif
		return ret;
	}
}
