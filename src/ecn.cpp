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

#include "quicio/ecn.hpp"

#if QUICIO_USE_IOSTREAM
#include <ostream>
#endif

namespace quicio {

	ecn_t parse_ecn_header_bits(std::uint8_t const tos)
	{
		switch (tos & ecn_mask)
		{
			case 0: return ecn_t::not_ect;
			case 1: return ecn_t::ect1;
			case 2: return ecn_t::ect0;
			default: return ecn_t::ce;
		}
	}

	std::uint8_t to_header_bits(ecn_t const e)
	{
		switch (e)
		{
			case ecn_t::ect1: return 1;
			case ecn_t::ect0: return 2;
			case ecn_t::ce: return 3;
			case ecn_t::not_ect:
			case ecn_t::unsupported:
				break;
		}
		return 0;
	}

	char const* ecn_name(ecn_t const e)
	{
		switch (e)
		{
			case ecn_t::unsupported: return "ECN unsupported";
			case ecn_t::not_ect: return "Not-ECT";
			case ecn_t::ect1: return "ECT(1)";
			case ecn_t::ect0: return "ECT(0)";
			case ecn_t::ce: return "CE";
		}
		return "invalid ECN value";
	}

#if QUICIO_USE_IOSTREAM
	std::ostream& operator<<(std::ostream& os, ecn_t const e)
	{
		return os << ecn_name(e);
	}
#endif
}
