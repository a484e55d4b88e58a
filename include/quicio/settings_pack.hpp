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

#ifndef QUICIO_SETTINGS_PACK_HPP_INCLUDED
#define QUICIO_SETTINGS_PACK_HPP_INCLUDED

#include "quicio/config.hpp"

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace quicio {

	// converts a setting name (as a string) into the setting enum value, or
	// -1 if the name isn't a known setting
	QUICIO_EXPORT int setting_by_name(std::string_view name);

	// returns the name of the setting \p s, or an empty string
	QUICIO_EXPORT char const* name_for_setting(int s);

	// The settings_pack holds the knobs controlling how a packet_conn
	// negotiates its capabilities and sizes its buffers. Settings are
	// identified by an enum value whose high bits encode its type. Settings
	// that have not been set return their default value.
	struct QUICIO_EXPORT settings_pack
	{
		// set a configuration option in the settings_pack. \p name is one of
		// the enum values from bool_types or int_types. The type of the
		// value must match the type of the setting
		void set_int(int name, int val);
		void set_bool(int name, bool val);

		// queries whether the specified configuration option has a value set
		// in this pack
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		// queries the current configuration option from the settings_pack.
		// If the setting isn't set, its default is returned
		int get_int(int name) const;
		bool get_bool(int name) const;

		// internal
		enum type_bases
		{
			int_type_base = 0x4000,
			bool_type_base = 0x8000,
			type_mask = 0xc000,
			index_mask = 0x3fff
		};

		enum bool_types : std::uint16_t
		{
			// skip the segmentation offload probe. GSO is reported as
			// unsupported
			disable_gso = bool_type_base,

			// don't set ECN marks on outgoing datagrams. The ECN bits of
			// incoming datagrams are still reported
			disable_ecn,

			max_bool_setting_internal
		};

		enum int_types : std::uint16_t
		{
			// the segment size used to probe for UDP segmentation offload
			gso_probe_segment_size = int_type_base,

			// the desired size of the kernel's receive and send buffers for
			// the socket, in bytes. 0 leaves the operating system default
			// in place
			recv_socket_buffer_size,
			send_socket_buffer_size,

			// the max number of idle buffers kept by a packet_pool
			max_cached_packets,

			max_int_setting_internal
		};

		enum settings_counts_t : std::uint16_t
		{
			num_int_settings = max_int_setting_internal - int_type_base,
			num_bool_settings = max_bool_setting_internal - bool_type_base
		};

	private:

		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};

	// applies the QUICIO_DISABLE_GSO and QUICIO_DISABLE_ECN environment
	// variables to \p p. A value of "1" or "true" sets the corresponding
	// setting to true, "0" or "false" sets it to false. Other values and
	// unset variables leave the setting untouched
	QUICIO_EXPORT void apply_environment(settings_pack& p);
}

#endif
