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

#ifndef QUICIO_DEBUG_HPP_INCLUDED
#define QUICIO_DEBUG_HPP_INCLUDED

#include "quicio/config.hpp"
#include "quicio/assert.hpp"

#if QUICIO_USE_ASSERTS
#include <thread>
#endif

namespace quicio {

#if QUICIO_USE_ASSERTS
	// records the first thread that calls is_single_thread() and fails the
	// check for calls from any other thread
	struct single_threaded
	{
		single_threaded(): m_id() {}
		~single_threaded() { m_id = std::thread::id(); }
		bool is_single_thread() const
		{
			if (m_id == std::thread::id())
			{
				m_id = std::this_thread::get_id();
				return true;
			}
			return m_id == std::this_thread::get_id();
		}

	private:
		mutable std::thread::id m_id;
	};
#else
	struct single_threaded {
		bool is_single_thread() const { return true; }
	};
#endif
}

#endif // QUICIO_DEBUG_HPP_INCLUDED
