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

#ifndef QUICIO_SPAN_HPP_INCLUDED
#define QUICIO_SPAN_HPP_INCLUDED

#include <array>
#include <algorithm> // for equal
#include <cstddef>
#include <type_traits>
#include "quicio/assert.hpp"

namespace quicio {

namespace aux {

	template <typename From, typename To>
	struct compatible_type
	{
		// conversions that are OK
		// int -> int
		// int const -> int const
		// int -> int const
		static const bool value = std::is_same<From, To>::value
			|| std::is_same<From, typename std::remove_const<To>::type>::value
			;
	};
}

	// a non-owning view of a contiguous range of T. Used for payloads and
	// ancillary data buffers throughout the library
	template <typename T>
	struct span
	{
		using difference_type = std::ptrdiff_t;
		using index_type = std::ptrdiff_t;

		span() noexcept : m_ptr(nullptr), m_len(0) {}

		template <typename U, typename
			= typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(span<U> const& v) noexcept // NOLINT
			: m_ptr(v.data()), m_len(v.size()) {}

		span(T* p, difference_type const l) noexcept : m_ptr(p), m_len(l) // NOLINT
		{ QUICIO_ASSERT(l >= 0); }

		template <typename U, std::size_t N>
		span(std::array<U, N>& arr) noexcept // NOLINT
			: m_ptr(arr.data()), m_len(static_cast<difference_type>(arr.size())) {}

		template <typename U, difference_type N>
		span(U (&arr)[N]) noexcept // NOLINT
			: m_ptr(&arr[0]), m_len(N) {}

		// anything with a .data() member function is considered a container
		// but only if the value type is compatible with T
		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(Cont& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<difference_type>(c.size())) {}

		// const spans may refer to const (and temporary) containers
		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value
				&& std::is_const<T>::value>::type>
		span(Cont const& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<difference_type>(c.size())) {}

		index_type size() const noexcept { return m_len; }
		bool empty() const noexcept { return m_len == 0; }
		T* data() const noexcept { return m_ptr; }

		using iterator = T*;
		using const_iterator = T const*;

		T* begin() const noexcept { return m_ptr; }
		T* end() const noexcept { return m_ptr + m_len; }

		T& front() const noexcept { QUICIO_ASSERT(m_len > 0); return m_ptr[0]; }
		T& back() const noexcept { QUICIO_ASSERT(m_len > 0); return m_ptr[m_len - 1]; }

		span<T> first(difference_type const n) const
		{
			QUICIO_ASSERT(size() >= n);
			return { data(), n };
		}

		span<T> last(difference_type const n) const
		{
			QUICIO_ASSERT(size() >= n);
			return { data() + size() - n, n };
		}

		span<T> subspan(index_type const offset) const
		{
			QUICIO_ASSERT(size() >= offset);
			return { data() + offset, size() - offset };
		}

		span<T> subspan(index_type const offset, difference_type const count) const
		{
			QUICIO_ASSERT(count >= 0);
			QUICIO_ASSERT(size() >= offset + count);
			return { data() + offset, count };
		}

		T& operator[](index_type const idx) const
		{
			QUICIO_ASSERT(idx < m_len);
			QUICIO_ASSERT(idx >= 0);
			return m_ptr[idx];
		}

	private:
		T* m_ptr;
		difference_type m_len;
	};

	template <class T, class U>
	inline bool operator==(span<T> const& lhs, span<U> const& rhs)
	{
		return lhs.size() == rhs.size()
			&& (lhs.data() == rhs.data() || std::equal(lhs.begin(), lhs.end(), rhs.begin()));
	}

	template <class T, class U>
	inline bool operator!=(span<T> const& lhs, span<U> const& rhs)
	{ return !(lhs == rhs); }
}

#endif // QUICIO_SPAN_HPP_INCLUDED
