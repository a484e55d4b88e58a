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

#ifndef QUICIO_CMSG_HPP_INCLUDED
#define QUICIO_CMSG_HPP_INCLUDED

#include <cstdint>
#include <cstddef>
#include <vector>

#include "quicio/config.hpp"
#include "quicio/span.hpp"
#include "quicio/error_code.hpp"
#include "quicio/ecn.hpp"
#include "quicio/aux_/io.hpp"

namespace quicio {

	// describes the binary layout of an ancillary data (control message)
	// header on one platform. The header is a length followed by a level
	// and a type, each a fixed width integer. Records in a control buffer
	// start at multiples of header_align and the payload of a record
	// starts at the header size rounded up to data_align.
	struct cmsg_layout
	{
		// width, in bytes, of the cmsg_len field
		int length_size;
		// width, in bytes, of the cmsg_level and cmsg_type fields
		int level_size;
		int type_size;
		// alignment of record start offsets
		int header_align;
		// alignment of the payload within a record
		int data_align;
		aux::byte_order order;

		// the size of the raw header struct
		constexpr int header_size() const
		{ return length_size + level_size + type_size; }

		constexpr int align_header(int const n) const
		{ return (n + header_align - 1) & ~(header_align - 1); }

		constexpr int align_data(int const n) const
		{ return (n + data_align - 1) & ~(data_align - 1); }

		// the offset of the payload from the start of the record
		constexpr int data_offset() const
		{ return align_data(header_size()); }

		// the value of the length field of a record with an \p n byte
		// payload (CMSG_LEN)
		constexpr int record_size(int const n) const
		{ return data_offset() + n; }

		// the number of bytes a record with an \p n byte payload occupies
		// in a buffer, including trailing padding (CMSG_SPACE)
		constexpr int record_space(int const n) const
		{ return align_data(header_size() + align_header(n)); }
	};

	// struct cmsghdr on Linux. cmsg_len is a size_t and everything is
	// aligned to sizeof(size_t)
	constexpr cmsg_layout linux_cmsg_layout{int(sizeof(std::size_t)), 4, 4
		, int(sizeof(std::size_t)), int(sizeof(std::size_t)), aux::native_byte_order};

	// Darwin uses a socklen_t cmsg_len and 32 bit alignment
	constexpr cmsg_layout darwin_cmsg_layout{4, 4, 4, 4, 4, aux::native_byte_order};

	// FreeBSD and the other BSDs use a socklen_t cmsg_len aligned to
	// sizeof(long)
	constexpr cmsg_layout bsd_cmsg_layout{4, 4, 4
		, int(sizeof(long)), int(sizeof(long)), aux::native_byte_order};

	// WSACMSGHDR. cmsg_len is a SIZE_T and records are aligned to the
	// natural pointer alignment
	constexpr cmsg_layout windows_cmsg_layout{int(sizeof(void*)), 4, 4
		, int(sizeof(void*)), int(sizeof(void*)), aux::byte_order::little};

#if defined QUICIO_LINUX
	constexpr cmsg_layout native_cmsg_layout = linux_cmsg_layout;
#elif defined QUICIO_DARWIN
	constexpr cmsg_layout native_cmsg_layout = darwin_cmsg_layout;
#elif defined QUICIO_WINDOWS
	constexpr cmsg_layout native_cmsg_layout = windows_cmsg_layout;
#else
	constexpr cmsg_layout native_cmsg_layout = bsd_cmsg_layout;
#endif

	struct cmsg_header
	{
		std::uint64_t length = 0;
		int level = 0;
		int type = 0;
	};

	// one record parsed out of a control buffer. data and remainder
	// point into the buffer that was parsed
	struct cmsg_record
	{
		cmsg_header header;
		span<char const> data;
		// the rest of the buffer, starting at the next record. Empty when
		// this was the last record
		span<char const> remainder;
	};

	// parses the record at the start of \p buf. If the buffer is too small
	// to hold a header, or the declared length is smaller than the header
	// or larger than the buffer, ec is set to
	// errors::invalid_control_message. Nothing outside \p buf is read.
	QUICIO_EXPORT cmsg_record parse_cmsg(span<char const> buf, error_code& ec
		, cmsg_layout const& layout = native_cmsg_layout);

	// appends one record with the specified level, type and payload to
	// \p buf, zero padded to record_space(data.size()).
	QUICIO_EXPORT void append_cmsg(std::vector<char>& buf, int level, int type
		, span<char const> data, cmsg_layout const& layout = native_cmsg_layout);

	// appends a segment size record (UDP_SEGMENT) carrying \p size as a 16
	// bit integer. Only valid on sockets where segmentation offload was
	// negotiated.
	QUICIO_EXPORT void append_segment_size(std::vector<char>& buf
		, std::uint16_t size, cmsg_layout const& layout = native_cmsg_layout);

	// appends a record setting the ECN bits of an outgoing datagram, in the
	// IPv4 TOS (IP_TOS) or the IPv6 traffic class (IPV6_TCLASS) depending
	// on \p ipv4. The payload is an int holding the two ECN bits.
	QUICIO_EXPORT void append_ecn(std::vector<char>& buf, ecn_t e, bool ipv4
		, cmsg_layout const& layout = native_cmsg_layout);

	// the level and type used for the records above on this platform
	QUICIO_EXTRA_EXPORT int segment_size_cmsg_level();
	QUICIO_EXTRA_EXPORT int segment_size_cmsg_type();
}

#endif
