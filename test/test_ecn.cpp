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

#include "test.hpp"
#include "quicio/ecn.hpp"

#include <sstream>

using namespace quicio;

QUICIO_TEST(parse_header_bits)
{
	TEST_CHECK(parse_ecn_header_bits(0) == ecn_t::not_ect);
	TEST_CHECK(parse_ecn_header_bits(1) == ecn_t::ect1);
	TEST_CHECK(parse_ecn_header_bits(2) == ecn_t::ect0);
	TEST_CHECK(parse_ecn_header_bits(3) == ecn_t::ce);
}

QUICIO_TEST(parse_ignores_dscp)
{
	// the upper six bits are the DSCP and don't affect the ECN codepoint
	TEST_CHECK(parse_ecn_header_bits(0xb8) == ecn_t::not_ect);
	TEST_CHECK(parse_ecn_header_bits(0xb9) == ecn_t::ect1);
	TEST_CHECK(parse_ecn_header_bits(0xfe) == ecn_t::ect0);
	TEST_CHECK(parse_ecn_header_bits(0xff) == ecn_t::ce);
}

QUICIO_TEST(to_header_bits)
{
	TEST_EQUAL(to_header_bits(ecn_t::unsupported), 0);
	TEST_EQUAL(to_header_bits(ecn_t::not_ect), 0);
	TEST_EQUAL(to_header_bits(ecn_t::ect1), 1);
	TEST_EQUAL(to_header_bits(ecn_t::ect0), 2);
	TEST_EQUAL(to_header_bits(ecn_t::ce), 3);

	for (ecn_t const e : {ecn_t::not_ect, ecn_t::ect1, ecn_t::ect0, ecn_t::ce})
		TEST_CHECK(parse_ecn_header_bits(to_header_bits(e)) == e);
}

QUICIO_TEST(names)
{
	TEST_EQUAL(std::string(ecn_name(ecn_t::unsupported)), "ECN unsupported");
	TEST_EQUAL(std::string(ecn_name(ecn_t::not_ect)), "Not-ECT");
	TEST_EQUAL(std::string(ecn_name(ecn_t::ect1)), "ECT(1)");
	TEST_EQUAL(std::string(ecn_name(ecn_t::ect0)), "ECT(0)");
	TEST_EQUAL(std::string(ecn_name(ecn_t::ce)), "CE");

	std::stringstream s;
	s << ecn_t::ce << " " << ecn_t::ect0;
	TEST_EQUAL(s.str(), "CE ECT(0)");
}
