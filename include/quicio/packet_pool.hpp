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

#ifndef QUICIO_PACKET_POOL_HPP
#define QUICIO_PACKET_POOL_HPP

#include "quicio/config.hpp"

#include "quicio/aux_/throw.hpp"
#include "quicio/assert.hpp"
#include "quicio/span.hpp"
#include "quicio/settings_pack.hpp"

#include <algorithm> // for max
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <vector>

namespace quicio {

	// internal: MTU and protocol header sizes constants
	constexpr int QUICIO_IPV4_HEADER = 20;
	constexpr int QUICIO_IPV6_HEADER = 40;
	constexpr int QUICIO_UDP_HEADER = 8;
	constexpr int QUICIO_ETHERNET_MTU = 1500;

	// the largest datagram payload that fits in an ethernet frame over
	// IPv6, and the size of the buffers handed out by the packet_pool
	constexpr int max_packet_buffer_size
		= QUICIO_ETHERNET_MTU - QUICIO_IPV6_HEADER - QUICIO_UDP_HEADER;

	// a datagram buffer
	struct packet
	{
		// the number of bytes actually allocated in 'buf'
		std::uint16_t allocated;

		// the number of bytes of 'buf' holding the datagram
		std::uint16_t size;

		// the actual packet buffer
		char buf[1];

		span<char> payload() { return { buf, size }; }
		span<char const> payload() const { return { buf, size }; }
		span<char> storage() { return { buf, allocated }; }
	};

	struct packet_deleter
	{
		// deleter for std::unique_ptr
		void operator()(packet* p) const
		{
			QUICIO_ASSERT(p != nullptr);
			p->~packet();
			std::free(p);
		}
	};

	using packet_ptr = std::unique_ptr<packet, packet_deleter>;

	// internal
	inline packet_ptr create_packet(int const size)
	{
		QUICIO_ASSERT(size >= 0);
		QUICIO_ASSERT(size <= (std::numeric_limits<std::uint16_t>::max)());
		packet* p = static_cast<packet*>(std::malloc(sizeof(packet) + std::size_t(size)));
		if (p == nullptr) aux::throw_ex<std::bad_alloc>();
		p = new (p) packet();
		p->allocated = static_cast<std::uint16_t>(size);
		p->size = 0;
		return packet_ptr(p);
	}

	// a cache of equally sized packet buffers. Buffers are handed out by
	// acquire() and owned by the caller until they are passed back to
	// release(). At most limit idle buffers are kept, the rest are
	// freed. The pool may be used from multiple threads.
	struct QUICIO_EXTRA_EXPORT packet_pool
	{
		explicit packet_pool(int const buffer_size = max_packet_buffer_size
			, std::size_t const limit = 64)
			: m_buffer_size(buffer_size)
			, m_limit(limit)
		{
			QUICIO_ASSERT(buffer_size > 0);
			QUICIO_ASSERT(buffer_size <= (std::numeric_limits<std::uint16_t>::max)());
			m_storage.reserve(m_limit);
		}

		// a pool of max_packet_buffer_size buffers, caching at most
		// max_cached_packets of them
		explicit packet_pool(settings_pack const& sett)
			: packet_pool(max_packet_buffer_size, std::size_t(
				(std::max)(0, sett.get_int(settings_pack::max_cached_packets))))
		{}

		packet_pool(packet_pool const&) = delete;
		packet_pool& operator=(packet_pool const&) = delete;

		// returns a buffer of buffer_size() bytes with its size set to 0
		packet_ptr acquire()
		{
			{
				std::lock_guard<std::mutex> l(m_mutex);
				if (!m_storage.empty())
				{
					packet_ptr ret = std::move(m_storage.back());
					m_storage.pop_back();
					ret->size = 0;
					return ret;
				}
			}
			return create_packet(m_buffer_size);
		}

		// hands a buffer back to the pool. Buffers that were not allocated
		// by a pool of this size are freed
		void release(packet_ptr p)
		{
			if (!p) return;
			if (p->allocated != m_buffer_size) return;

			std::lock_guard<std::mutex> l(m_mutex);
			if (m_storage.size() < m_limit)
				m_storage.push_back(std::move(p));
		}

		// periodically free up some of the cached packets
		void decay()
		{
			std::lock_guard<std::mutex> l(m_mutex);
			if (m_storage.empty()) return;
			m_storage.pop_back();
		}

		int buffer_size() const { return m_buffer_size; }

		// the number of idle buffers currently held by the pool
		std::size_t cached() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return m_storage.size();
		}

	private:
		int const m_buffer_size;
		std::size_t const m_limit;
		mutable std::mutex m_mutex;
		std::vector<packet_ptr> m_storage;
	};
}

#endif // QUICIO_PACKET_POOL_HPP
