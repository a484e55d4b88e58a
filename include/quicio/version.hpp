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

#ifndef QUICIO_VERSION_HPP_INCLUDED
#define QUICIO_VERSION_HPP_INCLUDED

#include "quicio/aux_/export.hpp"

#define QUICIO_VERSION_MAJOR 1
#define QUICIO_VERSION_MINOR 0
#define QUICIO_VERSION_TINY 0

// the format of this version is: MMmmtt
// M = Major version, m = minor version, t = tiny version
#define QUICIO_VERSION_NUM ((QUICIO_VERSION_MAJOR * 10000) + (QUICIO_VERSION_MINOR * 100) + QUICIO_VERSION_TINY)

#define QUICIO_VERSION "1.0.0"

namespace quicio {

	// the major, minor and tiny versions of quicio
	constexpr int version_major = 1;
	constexpr int version_minor = 0;
	constexpr int version_tiny = 0;

	// the quicio version in string form
	constexpr char const* version_str = "1.0.0";

	// returns the quicio version as string form in this format:
	// "<major>.<minor>.<tiny>"
	QUICIO_EXPORT char const* version();
}

#endif
