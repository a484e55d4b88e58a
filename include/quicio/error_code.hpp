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

#ifndef QUICIO_ERROR_CODE_HPP_INCLUDED
#define QUICIO_ERROR_CODE_HPP_INCLUDED

#include "quicio/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace quicio {

	namespace errors {

		// quicio uses boost.system's error_code class to represent
		// errors. quicio has its own error category quicio_category()
		// with the error codes defined by error_code_enum. Errors
		// returned by the operating system are reported verbatim in
		// system_category().
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// an ancillary data record declared a length smaller than its
			// header or larger than the remaining control buffer
			invalid_control_message,
			// reading the ECN bits could not be enabled for either IPv4 or
			// IPv6
			ecn_activation_failed,
			// reporting of the destination address could not be enabled for
			// either IPv4 or IPv6, on a socket bound to the unspecified
			// address
			packet_info_activation_failed,
			// the connection was closed
			connection_closed,
			// a segment size was passed to write_packet() but segmentation
			// offload was not negotiated for this socket
			gso_not_negotiated,
			// an ECN mark was passed to write_packet() but ECN was not
			// negotiated for this socket
			ecn_not_negotiated,
			// the batched receive call returned without any messages
			empty_batch,

			// the number of error codes
			error_code_max
		};

		// hidden
		QUICIO_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the quicio_error_category which
	// maps quicio error codes to human readable error messages.
	QUICIO_EXPORT boost::system::error_category& quicio_category();

	using boost::system::error_code;
	using boost::system::error_condition;
	using boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;

	// returns true if \p ec is the error the kernel reports when a segmented
	// send is rejected, typically because the network interface does not
	// support checksum offload.
	QUICIO_EXPORT bool is_gso_error(error_code const& ec);

	// returns true if \p ec is a permission error, as reported by send
	// calls blocked by a firewall rule.
	QUICIO_EXPORT bool is_permission_error(error_code const& ec);
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<quicio::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif
