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
#include "mock_packet_socket.hpp" // for counting_logger

#include "quicio/packet_socket.hpp"
#include "quicio/packet_conn.hpp"
#include "quicio/socket_buffer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <cstdio> // for printf
#include <string>
#include <thread>
#include <vector>

using namespace quicio;

namespace {

// opens a non-blocking socket bound to an ephemeral port on \p addr
void open_socket(udp::socket& s, address const& addr)
{
	s.open(addr.is_v4() ? udp::v4() : udp::v6());
	s.bind(udp::endpoint(addr, 0));
	s.non_blocking(true);
}

udp::endpoint loopback_endpoint(udp::socket const& s)
{
	return udp::endpoint(make_address("127.0.0.1"), s.local_endpoint().port());
}

// retries read_packet() for up to two seconds while the socket has nothing
// to read
received_packet read_with_timeout(packet_conn& c, error_code& ec)
{
	for (int i = 0; i < 200; ++i)
	{
		ec.clear();
		received_packet p = c.read_packet(ec);
		if (ec != boost::asio::error::would_block) return p;
		std::this_thread::sleep_for(milliseconds(10));
	}
	return received_packet();
}

int read_batch_with_timeout(udp_packet_socket& s, span<batch_message> msgs
	, error_code& ec)
{
	for (int i = 0; i < 200; ++i)
	{
		ec.clear();
		int const ret = s.read_batch(msgs, ec);
		if (ec != boost::asio::error::would_block) return ret;
		std::this_thread::sleep_for(milliseconds(10));
	}
	return 0;
}

std::string to_string(span<char const> s)
{
	return std::string(s.begin(), s.end());
}

} // anonymous namespace

QUICIO_TEST(payload_and_remote)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	udp::socket b(ios);
	open_socket(a, make_address("127.0.0.1"));
	open_socket(b, make_address("127.0.0.1"));
	udp_packet_socket sa(a);
	udp_packet_socket sb(b);

	std::string const msg = "hello loopback";
	error_code ec;
	int const sent = sa.write_message({msg.data(), std::ptrdiff_t(msg.size())}
		, {}, b.local_endpoint(), ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(sent, int(msg.size()));

	std::array<char, 1500> buf;
	std::array<batch_message, 1> msgs;
	msgs[0].buffer = buf;
	int const n = read_batch_with_timeout(sb, msgs, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(n, 1);
	TEST_EQUAL(msgs[0].bytes, int(msg.size()));
	TEST_EQUAL(std::string(buf.data(), std::size_t(msgs[0].bytes)), msg);
	TEST_EQUAL(msgs[0].from, a.local_endpoint());
	TEST_EQUAL(msgs[0].control_bytes, 0);
}

QUICIO_TEST(local_endpoint_and_options)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	open_socket(a, make_address("127.0.0.1"));
	udp_packet_socket sa(a);

	error_code ec;
	TEST_EQUAL(sa.local_endpoint(ec), a.local_endpoint());
	TEST_CHECK(!ec);

	sa.set_int_option(SOL_SOCKET, SO_REUSEADDR, 1, ec);
	TEST_CHECK(!ec);
	TEST_NE(sa.get_int_option(SOL_SOCKET, SO_REUSEADDR, ec), 0);
	TEST_CHECK(!ec);

	TEST_CHECK(inspect_receive_buffer_size(sa, ec) > 0);
	TEST_CHECK(!ec);
}

QUICIO_TEST(buffer_sizes)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	open_socket(a, make_address("127.0.0.1"));
	udp_packet_socket sa(a);
	counting_logger log;

	error_code ec;
	int const recv = set_receive_buffer_size(sa, 32768, log, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(recv >= 32768);

	int const send = set_send_buffer_size(sa, 32768, log, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(send >= 32768);
}

QUICIO_TEST(closed_socket)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	open_socket(a, make_address("127.0.0.1"));
	udp::endpoint const ep = a.local_endpoint();
	udp_packet_socket sa(a);
	a.close();

	std::array<char, 100> buf;
	std::array<batch_message, 1> msgs;
	msgs[0].buffer = buf;
	error_code ec;
	TEST_EQUAL(sa.read_batch(msgs, ec), 0);
	TEST_EQUAL(ec, error_code(boost::asio::error::bad_descriptor));

	ec.clear();
	char const payload[] = "x";
	TEST_EQUAL(sa.write_message(payload, {}, ep, ec), 0);
	TEST_CHECK(ec);
}

QUICIO_TEST(conn_batch_order)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	udp::socket b(ios);
	open_socket(a, make_address("127.0.0.1"));
	open_socket(b, make_address("127.0.0.1"));
	udp_packet_socket sa(a);
	udp_packet_socket sb(b);

	counting_logger log;
	packet_pool pool;
	packet_conn_params params;
	params.logger = &log;
	packet_conn receiver(sb, pool, params);
	TEST_CHECK(!receiver.packet_info_enabled());

	for (int i = 0; i < 5; ++i)
	{
		std::string const msg = "packet " + std::to_string(i);
		error_code ec;
		sa.write_message({msg.data(), std::ptrdiff_t(msg.size())}, {}, b.local_endpoint(), ec);
		TEST_CHECK(!ec);
	}

	for (int i = 0; i < 5; ++i)
	{
		error_code ec;
		received_packet p = read_with_timeout(receiver, ec);
		TEST_CHECK(!ec);
		if (ec) break;
		TEST_EQUAL(to_string(p.payload()), "packet " + std::to_string(i));
		TEST_EQUAL(p.remote, a.local_endpoint());
		pool.release(std::move(p.buffer));
	}
}

#if defined QUICIO_LINUX
QUICIO_TEST(ecn_and_packet_info)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	udp::socket b(ios);
	open_socket(a, make_address("127.0.0.1"));
	// bound to the unspecified address, so the destination is reported
	open_socket(b, make_address("0.0.0.0"));
	udp_packet_socket sa(a);
	udp_packet_socket sb(b);

	counting_logger log;
	packet_pool pool;
	packet_conn_params params;
	params.logger = &log;
	packet_conn sender(sa, pool, params);
	packet_conn receiver(sb, pool, params);
	TEST_CHECK(sender.capabilities().ecn);
	TEST_CHECK(receiver.packet_info_enabled());

	std::string const msg = "marked";
	error_code ec;
	sender.write_packet({msg.data(), std::ptrdiff_t(msg.size())}
		, loopback_endpoint(b), {}, 0, ecn_t::ect0, ec);
	TEST_CHECK(!ec);

	received_packet p = read_with_timeout(receiver, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(to_string(p.payload()), msg);
	TEST_CHECK(p.ecn == ecn_t::ect0);
	TEST_CHECK(p.info);
	if (p.info)
	{
		TEST_EQUAL(p.info->addr, make_address("127.0.0.1"));
		TEST_NE(p.info->if_index, 0);
	}

	// reply from the address the datagram arrived on
	ec.clear();
	std::vector<char> const control = p.info ? p.info->control_message() : std::vector<char>();
	receiver.write_packet({msg.data(), std::ptrdiff_t(msg.size())}
		, p.remote, control, 0, ecn_t::ce, ec);
	TEST_CHECK(!ec);

	received_packet reply = read_with_timeout(sender, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(to_string(reply.payload()), msg);
	TEST_CHECK(reply.ecn == ecn_t::ce);
	TEST_EQUAL(reply.remote, loopback_endpoint(b));
}

QUICIO_TEST(segmentation_offload)
{
	boost::asio::io_context ios;
	udp::socket a(ios);
	udp::socket b(ios);
	open_socket(a, make_address("127.0.0.1"));
	open_socket(b, make_address("127.0.0.1"));
	udp_packet_socket sa(a);
	udp_packet_socket sb(b);

	counting_logger log;
	packet_pool pool;
	packet_conn_params params;
	params.logger = &log;
	packet_conn sender(sa, pool, params);
	packet_conn receiver(sb, pool, params);
	if (!sender.capabilities().gso)
	{
		std::printf("GSO not supported, skipping\n");
		return;
	}

	std::vector<char> payload(2500);
	for (std::size_t i = 0; i < payload.size(); ++i)
		payload[i] = char('a' + (i / 1000));

	error_code ec;
	int const sent = sender.write_packet(payload, b.local_endpoint(), {}, 1000
		, ecn_t::unsupported, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(sent, 2500);

	int const sizes[] = {1000, 1000, 500};
	for (int i = 0; i < 3; ++i)
	{
		received_packet p = read_with_timeout(receiver, ec);
		TEST_CHECK(!ec);
		if (ec) break;
		TEST_EQUAL(p.payload().size(), sizes[i]);
		TEST_EQUAL(p.payload()[0], char('a' + i));
	}
}
#endif
