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

#ifndef QUICIO_AUX_IO_HPP_INCLUDED
#define QUICIO_AUX_IO_HPP_INCLUDED

#include <cstdint>
#include <type_traits>

#include <boost/predef/other/endian.h>

#include "quicio/assert.hpp"
#include "quicio/span.hpp"

namespace quicio::aux {

	// the byte order integer fields are stored in. Ancillary data is always
	// in the host's byte order, but the codec can be pointed at another
	// platform's layout (for tests)
	enum class byte_order : std::uint8_t { little, big };

#if BOOST_ENDIAN_BIG_BYTE
	constexpr byte_order native_byte_order = byte_order::big;
#else
	constexpr byte_order native_byte_order = byte_order::little;
#endif

	// reads an unsigned integer of width bytes (1 to 8) from the front
	// of view and advances it.
	template <class Byte>
	inline typename std::enable_if<sizeof(Byte)==1, std::uint64_t>::type
	read_uint(span<Byte>& view, int const width, byte_order const order)
	{
		QUICIO_ASSERT(width > 0 && width <= 8);
		QUICIO_ASSERT(view.size() >= width);
		std::uint64_t ret = 0;
		if (order == byte_order::big)
		{
			for (Byte const b : view.first(width))
			{
				ret <<= 8;
				ret |= static_cast<std::uint8_t>(b);
			}
		}
		else
		{
			int shift = 0;
			for (Byte const b : view.first(width))
			{
				ret |= std::uint64_t(static_cast<std::uint8_t>(b)) << shift;
				shift += 8;
			}
		}
		view = view.subspan(width);
		return ret;
	}

	// writes the low width bytes of val to the front of view
	// and advances it.
	template <class Byte>
	inline typename std::enable_if<sizeof(Byte)==1>::type
	write_uint(std::uint64_t const val, int const width, span<Byte>& view
		, byte_order const order)
	{
		QUICIO_ASSERT(width > 0 && width <= 8);
		QUICIO_ASSERT(view.size() >= width);
		if (order == byte_order::big)
		{
			int shift = width * 8;
			for (Byte& b : view.first(width))
			{
				shift -= 8;
				b = static_cast<Byte>((val >> shift) & 0xff);
			}
		}
		else
		{
			int shift = 0;
			for (Byte& b : view.first(width))
			{
				b = static_cast<Byte>((val >> shift) & 0xff);
				shift += 8;
			}
		}
		view = view.subspan(width);
	}

	// -- adaptors

	template <typename Byte>
	std::uint16_t read_uint16(span<Byte>& view, byte_order const order = native_byte_order)
	{ return static_cast<std::uint16_t>(read_uint(view, 2, order)); }

	template <typename Byte>
	std::uint32_t read_uint32(span<Byte>& view, byte_order const order = native_byte_order)
	{ return static_cast<std::uint32_t>(read_uint(view, 4, order)); }

	template <typename Byte>
	std::int32_t read_int32(span<Byte>& view, byte_order const order = native_byte_order)
	{ return static_cast<std::int32_t>(static_cast<std::uint32_t>(read_uint(view, 4, order))); }

	template <typename Byte>
	void write_uint16(std::uint16_t const val, span<Byte>& view, byte_order const order = native_byte_order)
	{ write_uint(val, 2, view, order); }

	template <typename Byte>
	void write_uint32(std::uint32_t const val, span<Byte>& view, byte_order const order = native_byte_order)
	{ write_uint(val, 4, view, order); }

	template <typename Byte>
	void write_int32(std::int32_t const val, span<Byte>& view, byte_order const order = native_byte_order)
	{ write_uint(static_cast<std::uint32_t>(val), 4, view, order); }
}

#endif // QUICIO_AUX_IO_HPP_INCLUDED
