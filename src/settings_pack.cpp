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
#include "quicio/assert.hpp"
#include "quicio/settings_pack.hpp"

#include <algorithm>
#include <array>
#include <cstdlib> // for getenv
#include <cstring>

namespace {

	template <class T>
	bool compare_first(std::pair<std::uint16_t, T> const& lhs
		, std::pair<std::uint16_t, T> const& rhs)
	{
		return lhs.first < rhs.first;
	}

	template <class T>
	void insort_replace(std::vector<std::pair<std::uint16_t, T>>& c, std::pair<std::uint16_t, T> v)
	{
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == v.first) i->second = std::move(v.second);
		else c.emplace(i, std::move(v));
	}

	template <class T>
	typename std::vector<std::pair<std::uint16_t, T>>::const_iterator
	find_setting(std::vector<std::pair<std::uint16_t, T>> const& c, int const name)
	{
		std::pair<std::uint16_t, T> v(static_cast<std::uint16_t>(name), T());
		auto const i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) return i;
		return c.end();
	}
}

namespace quicio {

	struct int_setting_entry_t
	{
		// the name of this setting. used for lookups by name
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		// the name of this setting. used for lookups by name
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings
	{{
		SET(gso_probe_segment_size, 1500),
		SET(recv_socket_buffer_size, 0),
		SET(send_socket_buffer_size, 0),
		SET(max_cached_packets, 64),
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings
	{{
		SET(disable_gso, false),
		SET(disable_ecn, false),
	}};

	} // anonymous namespace

#undef SET

	int setting_by_name(std::string_view const key)
	{
		for (int k = 0; k < int(int_settings.size()); ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < int(bool_settings.size()); ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		std::size_t const idx = std::size_t(s & settings_pack::index_mask);
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::int_type_base:
				if (idx >= int_settings.size()) break;
				return int_settings[idx].name;
			case settings_pack::bool_type_base:
				if (idx >= bool_settings.size()) break;
				return bool_settings[idx].name;
		}
		return "";
	}

	void settings_pack::set_int(int const name, int const val)
	{
		QUICIO_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		std::pair<std::uint16_t, int> v(static_cast<std::uint16_t>(name), val);
		insort_replace(m_ints, v);
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		QUICIO_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		std::pair<std::uint16_t, bool> v(static_cast<std::uint16_t>(name), val);
		insort_replace(m_bools, v);
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case int_type_base: return find_setting(m_ints, name) != m_ints.end();
			case bool_type_base: return find_setting(m_bools, name) != m_bools.end();
		}
		return false;
	}

	int settings_pack::get_int(int const name) const
	{
		QUICIO_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= int_settings.size()) return 0;

		auto const i = find_setting(m_ints, name);
		if (i != m_ints.end()) return i->second;
		return int_settings[idx].default_value;
	}

	bool settings_pack::get_bool(int const name) const
	{
		QUICIO_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= bool_settings.size()) return false;

		auto const i = find_setting(m_bools, name);
		if (i != m_bools.end()) return i->second;
		return bool_settings[idx].default_value;
	}

	void settings_pack::clear()
	{
		m_ints.clear();
		m_bools.clear();
	}

	void settings_pack::clear(int const name)
	{
		switch (name & type_mask)
		{
			case int_type_base:
			{
				std::pair<std::uint16_t, int> v(static_cast<std::uint16_t>(name), 0);
				auto const i = std::lower_bound(m_ints.begin(), m_ints.end()
					, v, &compare_first<int>);
				if (i != m_ints.end() && i->first == name) m_ints.erase(i);
				break;
			}
			case bool_type_base:
			{
				std::pair<std::uint16_t, bool> v(static_cast<std::uint16_t>(name), false);
				auto const i = std::lower_bound(m_bools.begin(), m_bools.end()
					, v, &compare_first<bool>);
				if (i != m_bools.end() && i->first == name) m_bools.erase(i);
				break;
			}
		}
	}

namespace {

	void apply_bool_env(settings_pack& p, int const name, char const* var)
	{
		char const* val = std::getenv(var);
		if (val == nullptr) return;
		if (std::strcmp(val, "1") == 0 || std::strcmp(val, "true") == 0)
			p.set_bool(name, true);
		else if (std::strcmp(val, "0") == 0 || std::strcmp(val, "false") == 0)
			p.set_bool(name, false);
	}
}

	void apply_environment(settings_pack& p)
	{
		apply_bool_env(p, settings_pack::disable_gso, "QUICIO_DISABLE_GSO");
		apply_bool_env(p, settings_pack::disable_ecn, "QUICIO_DISABLE_ECN");
	}
}
