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

#ifndef QUICIO_CONFIG_HPP_INCLUDED
#define QUICIO_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>
#include <boost/version.hpp>

#include "quicio/aux_/export.hpp"

#ifdef __linux__
#include <linux/version.h> // for LINUX_VERSION_CODE and KERNEL_VERSION
#endif // __linux

// ======= PLATFORMS =========

// set up defines for target environments

// ==== Darwin/BSD ===
#if (defined __APPLE__ && defined __MACH__) || defined __FreeBSD__ || defined __NetBSD__ \
	|| defined __OpenBSD__ || defined __bsdi__ || defined __DragonFly__ \
	|| defined __FreeBSD_kernel__
#define QUICIO_BSD

#if defined __APPLE__
#define QUICIO_DARWIN
#include <AvailabilityMacros.h>
// execinfo.h is available in the MacOS X 10.5 SDK.
#if MAC_OS_X_VERSION_MIN_REQUIRED >= 1050
#define QUICIO_USE_EXECINFO 1
#endif
#endif // __APPLE__

// ==== LINUX ===
#elif defined __linux__
#define QUICIO_LINUX

// recvmmsg() was added in linux 2.6.33
#if LINUX_VERSION_CODE >= KERNEL_VERSION(2,6,33)
#define QUICIO_USE_RECVMMSG 1
#endif

// UDP_SEGMENT (generic segmentation offload for UDP) was added in 4.18
#if LINUX_VERSION_CODE >= KERNEL_VERSION(4,18,0) && !defined __ANDROID__
#define QUICIO_USE_GSO 1
#endif

#if defined __GLIBC__ && ( defined __x86_64__ || defined __i386 \
	|| defined _M_X64 || defined _M_IX86 )
#define QUICIO_USE_EXECINFO 1
#endif

// ==== WINDOWS ===
#elif defined _WIN32
#define QUICIO_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX
#endif

#else
#ifdef _MSC_VER
#pragma message ( "unknown OS, assuming BSD" )
#else
#warning "unknown OS, assuming BSD"
#endif
#define QUICIO_BSD
#endif

#define QUICIO_UNUSED(x) (void)(x)

#if defined __GNUC__ || defined __clang__
#define QUICIO_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define QUICIO_FORMAT(fmt, ellipsis)
#endif

#ifndef QUICIO_USE_RECVMMSG
#define QUICIO_USE_RECVMMSG 0
#endif

#ifndef QUICIO_USE_GSO
#define QUICIO_USE_GSO 0
#endif

#ifndef QUICIO_USE_EXECINFO
#define QUICIO_USE_EXECINFO 0
#endif

#ifndef QUICIO_USE_IOSTREAM
#ifndef BOOST_NO_IOSTREAM
#define QUICIO_USE_IOSTREAM 1
#else
#define QUICIO_USE_IOSTREAM 0
#endif
#endif

// debug builds have asserts enabled by default, release
// builds have asserts if they are explicitly enabled by
// the release_asserts macro.
#ifndef QUICIO_USE_ASSERTS
#define QUICIO_USE_ASSERTS 0
#endif // QUICIO_USE_ASSERTS

#endif // QUICIO_CONFIG_HPP_INCLUDED
