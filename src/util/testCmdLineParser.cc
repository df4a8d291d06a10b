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
#include <stdexcept>
#include <string>

// Sqlrw headers
#include "util/CmdLineParser.h"

// Boost unit test header
#define BOOST_TEST_MODULE CmdLineParser
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace util = lsst::sqlrw::util;

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(ParseTest) {
    char const* const argv[] = {"sqlrw-rewrite", "SELECT 1", "--config=etc/sqlrw.cnf", "--report",
                                "--stages=presto,presto"};
    util::CmdLineParser const parser(5, argv, "usage");
    BOOST_CHECK_EQUAL(parser.numParameters(), 2U);
    BOOST_CHECK_EQUAL(parser.parameter(0), "sqlrw-rewrite");
    BOOST_CHECK_EQUAL(parser.parameter(1), "SELECT 1");
    BOOST_CHECK_THROW(parser.parameter(2), std::out_of_range);
    BOOST_CHECK_EQUAL(parser.option("config", ""), "etc/sqlrw.cnf");
    BOOST_CHECK_EQUAL(parser.option("stages", "presto"), "presto,presto");
    BOOST_CHECK_EQUAL(parser.option("missing", "presto"), "presto");
    BOOST_CHECK(parser.flag("report"));
    BOOST_CHECK(not parser.flag("validate"));
    BOOST_CHECK(not parser.flag("config"));
    BOOST_CHECK(parser.usage().find("--help") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(ValueWithEqualSign) {
    char const* const argv[] = {"sqlrw-rewrite", "--stages=a=b"};
    util::CmdLineParser const parser(2, argv, "usage");
    BOOST_CHECK_EQUAL(parser.option("stages", ""), "a=b");
}

BOOST_AUTO_TEST_CASE(ErrorTest) {
    for (char const* arg : {"--", "--config=", "--=presto", "--help"}) {
        char const* const argv[] = {"sqlrw-rewrite", arg};
        BOOST_CHECK_THROW(util::CmdLineParser(2, argv, "usage"), std::invalid_argument);
    }
}

BOOST_AUTO_TEST_SUITE_END()
