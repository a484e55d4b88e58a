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
#include "quicio/packet_socket.hpp"
#include "quicio/assert.hpp"

#ifndef QUICIO_WINDOWS

#include <boost/asio/error.hpp>

#include <cerrno>
#include <cstring> // for memcpy
#include <vector>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/uio.h>

namespace quicio {

namespace {

	void to_endpoint(sockaddr_storage const& sa, socklen_t const len, udp::endpoint& ep)
	{
		if (len == 0 || std::size_t(len) > ep.capacity())
		{
			ep = udp::endpoint();
			return;
		}
		std::memcpy(ep.data(), &sa, len);
		ep.resize(len);
	}

	void init_msghdr(msghdr& h, batch_message& m, iovec& iov, sockaddr_storage& name)
	{
		std::memset(&h, 0, sizeof(h));
		iov.iov_base = m.buffer.data();
		iov.iov_len = std::size_t(m.buffer.size());
		h.msg_name = &name;
		h.msg_namelen = sizeof(name);
		h.msg_iov = &iov;
		h.msg_iovlen = 1;
		if (!m.control.empty())
		{
			h.msg_control = m.control.data();
			h.msg_controllen = static_cast<decltype(h.msg_controllen)>(m.control.size());
		}
	}

	void fill_message(batch_message& m, msghdr const& h, int const bytes
		, sockaddr_storage const& name)
	{
		m.bytes = bytes;
		m.control_bytes = int(h.msg_controllen);
		m.flags = h.msg_flags;
		to_endpoint(name, h.msg_namelen, m.from);
	}

	void set_last_error(error_code& ec)
	{
		ec.assign(errno, boost::system::system_category());
	}
}

	udp_packet_socket::udp_packet_socket(udp::socket& s)
		: m_socket(s)
	{}

	int udp_packet_socket::read_one(batch_message& msg, error_code& ec)
	{
		ec.clear();
		msghdr h;
		iovec iov;
		sockaddr_storage name;
		init_msghdr(h, msg, iov, name);

		ssize_t ret;
		do
		{
			ret = ::recvmsg(m_socket.native_handle(), &h, 0);
		} while (ret < 0 && errno == EINTR);

		if (ret < 0)
		{
			set_last_error(ec);
			return 0;
		}

		fill_message(msg, h, int(ret), name);
		return 1;
	}

	int udp_packet_socket::read_batch(span<batch_message> const msgs, error_code& ec)
	{
		ec.clear();
		if (!m_socket.is_open())
		{
			ec = boost::asio::error::bad_descriptor;
			return 0;
		}
		if (msgs.empty()) return 0;

#if QUICIO_USE_RECVMMSG
		if (msgs.size() > 1)
		{
			std::size_t const num = std::size_t(msgs.size());
			std::vector<mmsghdr> hdrs(num);
			std::vector<iovec> iov(num);
			std::vector<sockaddr_storage> names(num);

			for (std::size_t i = 0; i < num; ++i)
			{
				init_msghdr(hdrs[i].msg_hdr, msgs[std::ptrdiff_t(i)], iov[i], names[i]);
				hdrs[i].msg_len = 0;
			}

			int ret;
			do
			{
				// MSG_WAITFORONE blocks for the first message only, then returns
				// whatever else is queued
				ret = ::recvmmsg(m_socket.native_handle(), hdrs.data()
					, static_cast<unsigned int>(num), MSG_WAITFORONE, nullptr);
			} while (ret < 0 && errno == EINTR);

			if (ret < 0)
			{
				set_last_error(ec);
				return 0;
			}

			for (int i = 0; i < ret; ++i)
			{
				fill_message(msgs[i], hdrs[std::size_t(i)].msg_hdr
					, int(hdrs[std::size_t(i)].msg_len), names[std::size_t(i)]);
			}
			return ret;
		}
#endif
		return read_one(msgs[0], ec);
	}

	int udp_packet_socket::write_message(span<char const> const payload
		, span<char const> const control, udp::endpoint const& to, error_code& ec)
	{
		ec.clear();
		if (!m_socket.is_open())
		{
			ec = boost::asio::error::bad_descriptor;
			return 0;
		}

		msghdr h;
		std::memset(&h, 0, sizeof(h));
		iovec iov;
		iov.iov_base = const_cast<char*>(payload.data());
		iov.iov_len = std::size_t(payload.size());
		h.msg_name = const_cast<void*>(static_cast<void const*>(to.data()));
		h.msg_namelen = static_cast<socklen_t>(to.size());
		h.msg_iov = &iov;
		h.msg_iovlen = 1;
		if (!control.empty())
		{
			h.msg_control = const_cast<char*>(control.data());
			h.msg_controllen = static_cast<decltype(h.msg_controllen)>(control.size());
		}

		ssize_t ret;
		do
		{
			ret = ::sendmsg(m_socket.native_handle(), &h, 0);
		} while (ret < 0 && errno == EINTR);

		if (ret < 0)
		{
			set_last_error(ec);
			return 0;
		}
		return int(ret);
	}

	void udp_packet_socket::set_int_option(int const level, int const name
		, int const value, error_code& ec)
	{
		m_socket.set_option(aux::int_socket_option(level, name, value), ec);
	}

	int udp_packet_socket::get_int_option(int const level, int const name
		, error_code& ec) const
	{
		aux::int_socket_option opt(level, name);
		m_socket.get_option(opt, ec);
		return opt.value();
	}

	udp::endpoint udp_packet_socket::local_endpoint(error_code& ec) const
	{
		return m_socket.local_endpoint(ec);
	}
}

#endif // QUICIO_WINDOWS
