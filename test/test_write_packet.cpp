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

#include "test.hpp"
#include "mock_packet_socket.hpp"

#include "quicio/packet_conn.hpp"
#include "quicio/packet_info.hpp"
#include "quicio/cmsg.hpp"
#include "quicio/aux_/io.hpp"

#include <cstring> // for memcpy
#include <string>
#include <vector>

#include <arpa/inet.h> // for ntohl
#include <netinet/in.h>

using namespace quicio;

namespace {

udp::endpoint const v4_peer(make_address_v4("192.0.2.7"), 1234);
udp::endpoint const v6_peer(make_address_v6("2001:db8::7"), 1234);
udp::endpoint const mapped_peer(make_address_v6("::ffff:192.0.2.7"), 1234);

std::string const payload_str = "hello world";
span<char const> const payload(payload_str.data(), std::ptrdiff_t(payload_str.size()));

struct fixture
{
	explicit fixture(bool const gso = true, bool const ecn = true)
	{
		params.logger = &log;
		params.settings.set_bool(settings_pack::disable_gso, !gso);
		params.settings.set_bool(settings_pack::disable_ecn, !ecn);
	}

	mock_packet_socket sock;
	counting_logger log;
	packet_pool pool;
	packet_conn_params params;
};

} // anonymous namespace

QUICIO_TEST(plain_write)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	int const ret = c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(ret, int(payload_str.size()));
	TEST_EQUAL(f.sock.writes.size(), 1);
	TEST_EQUAL(std::string(f.sock.writes[0].payload.begin(), f.sock.writes[0].payload.end()), payload_str);
	TEST_CHECK(f.sock.writes[0].control.empty());
	TEST_EQUAL(f.sock.writes[0].to, v4_peer);
}

QUICIO_TEST(base_control_passed_through)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	packet_info info;
	info.addr = make_address("10.0.0.1");
	info.if_index = 2;
	std::vector<char> const base = info.control_message();

	error_code ec;
	c.write_packet(payload, v4_peer, base, 0, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(f.sock.writes.size(), 1);
	TEST_CHECK(f.sock.writes[0].control == base);
}

QUICIO_TEST(ecn_v4)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	c.write_packet(payload, v4_peer, {}, 0, ecn_t::ect0, ec);
	TEST_CHECK(!ec);

	std::vector<char> expected;
	append_ecn(expected, ecn_t::ect0, true);
	TEST_CHECK(f.sock.writes[0].control == expected);

	error_code err;
	cmsg_record const r = parse_cmsg(f.sock.writes[0].control, err);
	TEST_CHECK(!err);
	TEST_EQUAL(r.header.level, int(IPPROTO_IP));
	TEST_EQUAL(r.header.type, int(IP_TOS));
	span<char const> data = r.data;
	TEST_EQUAL(aux::read_int32(data), 2);
}

QUICIO_TEST(ecn_v6)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	c.write_packet(payload, v6_peer, {}, 0, ecn_t::ce, ec);
	TEST_CHECK(!ec);

	error_code err;
	cmsg_record const r = parse_cmsg(f.sock.writes[0].control, err);
	TEST_CHECK(!err);
	TEST_EQUAL(r.header.level, int(IPPROTO_IPV6));
	TEST_EQUAL(r.header.type, int(IPV6_TCLASS));
	span<char const> data = r.data;
	TEST_EQUAL(aux::read_int32(data), 3);
}

QUICIO_TEST(ecn_v4_mapped)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	c.write_packet(payload, mapped_peer, {}, 0, ecn_t::ect1, ec);
	TEST_CHECK(!ec);

	// the datagram carries an IPv4 header, so the mark is set with IP_TOS
	std::vector<char> expected;
	append_ecn(expected, ecn_t::ect1, true);
	TEST_CHECK(f.sock.writes[0].control == expected);
	TEST_EQUAL(f.sock.writes[0].to, mapped_peer);
}

QUICIO_TEST(not_ect_mark)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	c.write_packet(payload, v4_peer, {}, 0, ecn_t::not_ect, ec);
	TEST_CHECK(!ec);

	std::vector<char> expected;
	append_ecn(expected, ecn_t::not_ect, true);
	TEST_CHECK(f.sock.writes[0].control == expected);
}

#if QUICIO_USE_GSO
QUICIO_TEST(record_order)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);
	TEST_CHECK(c.capabilities().gso);

	packet_info info;
	info.addr = make_address("10.0.0.1");
	info.if_index = 2;
	std::vector<char> const base = info.control_message();

	error_code ec;
	c.write_packet(payload, v4_peer, base, 1200, ecn_t::ect0, ec);
	TEST_CHECK(!ec);

	std::vector<char> expected = base;
	append_segment_size(expected, 1200);
	append_ecn(expected, ecn_t::ect0, true);
	TEST_CHECK(f.sock.writes[0].control == expected);

	// walk the chain and check the levels come out in order
	std::vector<std::pair<int, int>> seen;
	span<char const> chain = f.sock.writes[0].control;
	while (!chain.empty())
	{
		error_code err;
		cmsg_record const r = parse_cmsg(chain, err);
		TEST_CHECK(!err);
		if (err) break;
		seen.emplace_back(r.header.level, r.header.type);
		chain = r.remainder;
	}
	TEST_EQUAL(seen.size(), 3);
	TEST_CHECK(seen[0] == std::make_pair(int(IPPROTO_IP), int(IP_PKTINFO)));
	TEST_CHECK(seen[1] == std::make_pair(segment_size_cmsg_level(), segment_size_cmsg_type()));
	TEST_CHECK(seen[2] == std::make_pair(int(IPPROTO_IP), int(IP_TOS)));
}

QUICIO_TEST(segment_size_only)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);

	error_code ec;
	c.write_packet(payload, v6_peer, {}, 1350, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);

	error_code err;
	cmsg_record const r = parse_cmsg(f.sock.writes[0].control, err);
	TEST_CHECK(!err);
	TEST_EQUAL(r.header.level, segment_size_cmsg_level());
	TEST_EQUAL(r.header.type, segment_size_cmsg_type());
	span<char const> data = r.data;
	TEST_EQUAL(aux::read_uint16(data), 1350);
	TEST_CHECK(r.remainder.empty());
}
#endif

QUICIO_TEST(gso_not_negotiated)
{
	fixture f(false, true);
	packet_conn c(f.sock, f.pool, f.params);
	TEST_CHECK(!c.capabilities().gso);

	error_code ec;
	bool thrown = false;
	try
	{
		c.write_packet(payload, v4_peer, {}, 1200, ecn_t::unsupported, ec);
	}
	catch (system_error const& e)
	{
		thrown = true;
		TEST_EQUAL(e.code(), error_code(errors::gso_not_negotiated));
	}
	TEST_CHECK(thrown);
	TEST_CHECK(f.sock.writes.empty());

	// without a segment size the write goes through
	c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(f.sock.writes.size(), 1);
}

QUICIO_TEST(gso_probe_rejected_by_socket)
{
	fixture f;
	f.sock.reject(segment_size_cmsg_level(), segment_size_cmsg_type());
	packet_conn c(f.sock, f.pool, f.params);
	TEST_CHECK(!c.capabilities().gso);

	error_code ec;
	bool thrown = false;
	try
	{
		c.write_packet(payload, v4_peer, {}, 1200, ecn_t::unsupported, ec);
	}
	catch (system_error const& e)
	{
		thrown = true;
		TEST_EQUAL(e.code(), error_code(errors::gso_not_negotiated));
	}
	TEST_CHECK(thrown);
	TEST_CHECK(f.sock.writes.empty());
}

QUICIO_TEST(ecn_not_negotiated)
{
	fixture f(true, false);
	packet_conn c(f.sock, f.pool, f.params);
	TEST_CHECK(!c.capabilities().ecn);

	error_code ec;
	bool thrown = false;
	try
	{
		c.write_packet(payload, v4_peer, {}, 0, ecn_t::ect0, ec);
	}
	catch (system_error const& e)
	{
		thrown = true;
		TEST_EQUAL(e.code(), error_code(errors::ecn_not_negotiated));
	}
	TEST_CHECK(thrown);
	TEST_CHECK(f.sock.writes.empty());

	c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(f.sock.writes.size(), 1);
	TEST_CHECK(f.sock.writes[0].control.empty());
}

QUICIO_TEST(write_error)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);
	f.sock.write_error = error_code(EPERM, system_category());

	error_code ec;
	int const ret = c.write_packet(payload, v4_peer, {}, 0, ecn_t::ect0, ec);
	TEST_EQUAL(ret, 0);
	TEST_EQUAL(ec, error_code(EPERM, system_category()));
	TEST_CHECK(is_permission_error(ec));
	TEST_CHECK(!is_gso_error(ec));
}

QUICIO_TEST(error_code_reused_after_write_error)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);
	f.sock.write_error = error_code(EPERM, system_category());

	error_code ec;
	TEST_EQUAL(c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec), 0);
	TEST_EQUAL(ec, error_code(EPERM, system_category()));

	f.sock.write_error.clear();
	int const ret = c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(ret, int(payload_str.size()));
	TEST_EQUAL(f.sock.writes.size(), 1);
}

QUICIO_TEST(gso_error_classification)
{
	error_code const eio(EIO, system_category());
#if defined QUICIO_LINUX
	TEST_CHECK(is_gso_error(eio));
#else
	TEST_CHECK(!is_gso_error(eio));
#endif
	TEST_CHECK(!is_gso_error(error_code()));
	TEST_CHECK(!is_gso_error(error_code(EPERM, system_category())));
	TEST_CHECK(!is_permission_error(eio));
	TEST_CHECK(is_permission_error(error_code(EPERM, generic_category())));
}

QUICIO_TEST(write_closed)
{
	fixture f;
	packet_conn c(f.sock, f.pool, f.params);
	c.close();

	error_code ec;
	int const ret = c.write_packet(payload, v4_peer, {}, 0, ecn_t::unsupported, ec);
	TEST_EQUAL(ret, 0);
	TEST_EQUAL(ec, error_code(errors::connection_closed));
	TEST_CHECK(f.sock.writes.empty());
}

#if defined QUICIO_LINUX
QUICIO_TEST(packet_info_v4_record)
{
	packet_info info;
	info.addr = make_address("10.1.2.3");
	info.if_index = 5;
	std::vector<char> const buf = info.control_message();

	error_code ec;
	cmsg_record const r = parse_cmsg(buf, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.header.level, int(IPPROTO_IP));
	TEST_EQUAL(r.header.type, int(IP_PKTINFO));
	TEST_EQUAL(r.data.size(), ipv4_packet_info_size());
	TEST_EQUAL(r.data.size(), int(sizeof(in_pktinfo)));

	// ipi_ifindex, then the source address in ipi_spec_dst
	in_pktinfo pi;
	std::memcpy(&pi, r.data.data(), sizeof(pi));
	TEST_EQUAL(pi.ipi_ifindex, 5);
	TEST_EQUAL(address_v4(ntohl(pi.ipi_spec_dst.s_addr)), make_address_v4("10.1.2.3"));
	TEST_EQUAL(pi.ipi_addr.s_addr, 0);
}
#endif

QUICIO_TEST(packet_info_v6_record)
{
	packet_info info;
	info.addr = make_address("2001:db8::5");
	info.if_index = 9;
	std::vector<char> const buf = info.control_message();

	error_code ec;
	cmsg_record const r = parse_cmsg(buf, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.header.level, int(IPPROTO_IPV6));
	TEST_EQUAL(r.header.type, int(IPV6_PKTINFO));
	TEST_EQUAL(r.data.size(), ipv6_packet_info_size);

	boost::optional<packet_info> const parsed = parse_ipv6_packet_info(r.data);
	TEST_CHECK(parsed);
	TEST_EQUAL(parsed->addr, info.addr);
	TEST_EQUAL(parsed->if_index, 9);
}

QUICIO_TEST(packet_info_v4_mapped_record)
{
	packet_info info;
	info.addr = make_address("::ffff:10.1.2.3");
	std::vector<char> const buf = info.control_message();

	error_code ec;
	cmsg_record const r = parse_cmsg(buf, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.header.level, int(IPPROTO_IP));
	TEST_EQUAL(r.data.size(), ipv4_packet_info_size());
}
