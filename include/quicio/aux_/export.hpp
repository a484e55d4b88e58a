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

#ifndef QUICIO_EXPORT_HPP_INCLUDED
#define QUICIO_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// QUICIO_BUILDING_SHARED is defined when building quicio as a shared
// library, QUICIO_LINKING_SHARED when linking against one
#if defined QUICIO_BUILDING_SHARED
# define QUICIO_EXPORT BOOST_SYMBOL_EXPORT
#elif defined QUICIO_LINKING_SHARED
# define QUICIO_EXPORT BOOST_SYMBOL_IMPORT
#endif

// exports internal functions the unit tests call
#ifdef QUICIO_EXPORT_EXTRA
# define QUICIO_EXTRA_EXPORT QUICIO_EXPORT
#endif

#ifndef QUICIO_EXPORT
# define QUICIO_EXPORT
#endif

#ifndef QUICIO_EXTRA_EXPORT
# define QUICIO_EXTRA_EXPORT
#endif

#endif // QUICIO_EXPORT_HPP_INCLUDED
