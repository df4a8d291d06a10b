// -*- LSST-C++ -*-
/*
 * LSST Data Management System
 *
 * This product includes software developed by the
 * LSST Project (http://www.lsst.org/).
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the LSST License Statement and
 * the GNU General Public License along with this program.  If not,
 * see <http://www.lsstcorp.org/LegalNotices/>.
 */

// System headers
#include <string>
#include <vector>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "util/String.h"

// Boost unit test header
#define BOOST_TEST_MODULE String
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace util = lsst::sqlrw::util;

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(SplitStringTest) {
    LOGS_INFO("SplitStringTest begins");
    {
        std::string const emptyStr;
        auto const vect = util::String::split(emptyStr, ",");
        BOOST_REQUIRE_EQUAL(vect.size(), 1U);
        BOOST_CHECK_EQUAL(vect[0], emptyStr);
    }
    {
        auto const vect = util::String::split(std::string(), ",", true);
        BOOST_CHECK_EQUAL(vect.size(), 0U);
    }
    {
        auto const vect = util::String::split("presto,,quoting", ",");
        LOGS_DEBUG("vect=" << util::String::toString(vect, ",", "'", "'"));
        size_t j = 0;
        BOOST_CHECK_EQUAL(vect[j++], "presto");
        BOOST_CHECK_EQUAL(vect[j++], "");
        BOOST_CHECK_EQUAL(vect[j++], "quoting");
        BOOST_CHECK_EQUAL(vect.size(), j);
    }
    {
        auto const vect = util::String::split("presto,,quoting,", ",", true);
        BOOST_CHECK_EQUAL(util::String::toString(vect), "presto,quoting");
    }
    {
        auto const vect = util::String::split("a b", "");
        BOOST_REQUIRE_EQUAL(vect.size(), 1U);
        BOOST_CHECK_EQUAL(vect[0], "a b");
    }
}

BOOST_AUTO_TEST_CASE(CaseAndTrimTest) {
    BOOST_CHECK_EQUAL(util::String::trim("  presto \t\n"), "presto");
    BOOST_CHECK_EQUAL(util::String::trim(" \t "), "");
    BOOST_CHECK_EQUAL(util::String::toLower("RLike"), "rlike");
    BOOST_CHECK_EQUAL(util::String::toLower("\xC4RRAY"), "\xC4rray");
    BOOST_CHECK(not util::String::equalsIgnoreCase("\xC1rray", "array"));
    BOOST_CHECK(not util::String::equalsIgnoreCase("\xE1rray", "\xC1RRAY"));
    BOOST_CHECK(util::String::equalsIgnoreCase("Explode", "EXPLODE"));
    BOOST_CHECK(not util::String::equalsIgnoreCase("explode", "explode_outer"));
    BOOST_CHECK_EQUAL(util::String::toString(std::vector<int>{1, 2, 3}, ", ", "[", "]"), "[1], [2], [3]");
}

BOOST_AUTO_TEST_CASE(TrimLineBreaksTest) {
    BOOST_CHECK_EQUAL(util::String::trimLineBreaks("SELECT 1\n"), "SELECT 1");
    BOOST_CHECK_EQUAL(util::String::trimLineBreaks("SELECT 1\r\n\n"), "SELECT 1");
    BOOST_CHECK_EQUAL(util::String::trimLineBreaks("SELECT 1 -- c\n"), "SELECT 1 -- c");
    BOOST_CHECK_EQUAL(util::String::trimLineBreaks("\nSELECT\n1 "), "\nSELECT\n1 ");
    BOOST_CHECK_EQUAL(util::String::trimLineBreaks("\n\n"), "");
}

BOOST_AUTO_TEST_SUITE_END()
