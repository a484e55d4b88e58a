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

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "quicio/packet_conn.hpp"
#include "quicio/packet_socket.hpp"
#include "quicio/socket_buffer.hpp"
#include "quicio/logger.hpp"
#include "quicio/version.hpp"

// binds a UDP socket and sends every datagram back to where it came from,
// with the ECN mark it arrived with and from the address it arrived on
int main(int argc, char const* argv[]) try
{
	if (argc < 2 || argc > 3) {
		std::cerr << "usage: " << argv[0] << " <port> [bind-address]\n"
			"quicio " << quicio::version() << "\n"
			"set QUICIO_LOG_LEVEL=debug to see the negotiated capabilities\n";
		return 1;
	}

	int const port = std::atoi(argv[1]);
	quicio::address const bind_addr = quicio::make_address(argc > 2 ? argv[2] : "0.0.0.0");

	boost::asio::io_context ios;
	quicio::udp::socket sock(ios);
	sock.open(bind_addr.is_v4() ? quicio::udp::v4() : quicio::udp::v6());
	sock.bind(quicio::udp::endpoint(bind_addr, static_cast<unsigned short>(port)));

	quicio::udp_packet_socket s(sock);
	quicio::packet_conn_params params;
	quicio::apply_environment(params.settings);
	params.settings.set_int(quicio::settings_pack::recv_socket_buffer_size, 1 << 21);

	quicio::error_code ec;
	quicio::apply_socket_buffer_sizes(s, params.settings, quicio::default_logger(), ec);
	if (ec) {
		std::fprintf(stderr, "failed to set socket buffer sizes: %s\n", ec.message().c_str());
		return 1;
	}

	quicio::packet_pool pool(params.settings);
	quicio::packet_conn conn(s, pool, params);
	quicio::conn_capabilities const caps = conn.capabilities();
	std::printf("listening on %s (GSO: %s, ECN: %s, packet info: %s)\n"
		, sock.local_endpoint().address().to_string().c_str()
		, caps.gso ? "yes" : "no", caps.ecn ? "yes" : "no"
		, conn.packet_info_enabled() ? "yes" : "no");

	for (;;) {
		quicio::received_packet p = conn.read_packet(ec);
		if (ec == quicio::errors::invalid_control_message) {
			std::fprintf(stderr, "dropping packet: %s\n", ec.message().c_str());
			ec.clear();
			continue;
		}
		if (ec) {
			std::fprintf(stderr, "read failed: %s\n", ec.message().c_str());
			break;
		}

		std::vector<char> const control = p.info
			? p.info->control_message() : std::vector<char>();
		quicio::ecn_t const mark = caps.ecn ? p.ecn : quicio::ecn_t::unsupported;
		conn.write_packet(p.payload(), p.remote, control, 0, mark, ec);
		if (ec) {
			std::fprintf(stderr, "failed to echo %d bytes to %s: %s\n"
				, int(p.payload().size()), p.remote.address().to_string().c_str()
				, ec.message().c_str());
			ec.clear();
		}
		pool.release(std::move(p.buffer));
	}
	return 0;
}
catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}
