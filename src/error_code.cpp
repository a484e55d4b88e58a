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
#include "quicio/error_code.hpp"

#include <cerrno>
#include <string>

namespace quicio {

	struct quicio_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* quicio_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "quicio";
	}

	std::string quicio_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"invalid control message",
			"activating ECN failed for both IPv4 and IPv6",
			"activating packet info failed for both IPv4 and IPv6",
			"connection closed",
			"GSO was not negotiated for this socket",
			"ECN was not negotiated for this socket",
			"batched receive returned no messages",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& quicio_category()
	{
		static quicio_error_category quicio_category;
		return quicio_category;
	}

	namespace errors {

		boost::system::error_code make_error_code(error_code_enum e)
		{
			return boost::system::error_code(e, quicio_category());
		}
	}

	bool is_gso_error(error_code const& ec)
	{
#ifdef QUICIO_LINUX
		return ec == boost::system::errc::io_error;
#else
		QUICIO_UNUSED(ec);
		return false;
#endif
	}

	bool is_permission_error(error_code const& ec)
	{
		return ec == boost::system::errc::operation_not_permitted;
	}
}
