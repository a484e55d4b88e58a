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

#ifndef QUICIO_SOCKET_HPP_INCLUDED
#define QUICIO_SOCKET_HPP_INCLUDED

#include "quicio/config.hpp"

#include <cstddef>

#include <boost/asio/ip/udp.hpp>
#include <boost/asio/ip/address.hpp>

namespace quicio {

	using udp = boost::asio::ip::udp;
	using boost::asio::ip::address;
	using boost::asio::ip::address_v4;
	using boost::asio::ip::address_v6;
	using boost::asio::ip::make_address;
	using boost::asio::ip::make_address_v4;
	using boost::asio::ip::make_address_v6;

	// returns true if \p a is an IPv4 address or an IPv4-mapped IPv6
	// address. Datagrams to such addresses carry IPv4 headers.
	inline bool is_v4_on_wire(address const& a)
	{
		return a.is_v4() || (a.is_v6() && a.to_v6().is_v4_mapped());
	}

	// strips the IPv4-mapped IPv6 prefix, if there is one
	inline address unmap(address const& a)
	{
		if (a.is_v6() && a.to_v6().is_v4_mapped())
			return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, a.to_v6());
		return a;
	}

namespace aux {

	// an integer socket option with a level and name only known at run
	// time. It models both the SettableSocketOption and the
	// GettableSocketOption concepts of asio
	struct int_socket_option
	{
		int_socket_option(int const level, int const name, int const value = 0)
			: m_level(level), m_name(name), m_value(value) {}

		template<class Protocol>
		int level(Protocol const&) const { return m_level; }

		template<class Protocol>
		int name(Protocol const&) const { return m_name; }

		template<class Protocol>
		int* data(Protocol const&) { return &m_value; }

		template<class Protocol>
		int const* data(Protocol const&) const { return &m_value; }

		template<class Protocol>
		std::size_t size(Protocol const&) const { return sizeof(m_value); }

		template<class Protocol>
		void resize(Protocol const&, std::size_t) {}

		int value() const { return m_value; }

	private:
		int m_level;
		int m_name;
		int m_value;
	};
}
}

#endif // QUICIO_SOCKET_HPP_INCLUDED
