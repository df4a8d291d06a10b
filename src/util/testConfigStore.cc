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
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "util/ConfigStore.h"
#include "util/ConfigStoreError.h"

// Boost unit test header
#define BOOST_TEST_MODULE ConfigStore
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace util = lsst::sqlrw::util;

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(ConfigStoreTest) {
    LOGS_INFO("ConfigStore test begins");
    util::ConfigStore const configStore(std::map<std::string, std::string>{
            {"rewrite.stages", "presto"}, {"rewrite.report", "Yes"}, {"rewrite.empty", ""}});
    LOGS_DEBUG("configStore: " << configStore);

    BOOST_CHECK_EQUAL(configStore.get("rewrite.stages"), "presto");
    BOOST_CHECK_EQUAL(configStore.get("rewrite.missing", "default"), "default");
    BOOST_CHECK_EQUAL(configStore.get("rewrite.missing"), "");
    BOOST_CHECK_EQUAL(configStore.get("rewrite.empty", "default"), "default");
    BOOST_CHECK_EQUAL(configStore.get("stages", "default"), "default");

    BOOST_CHECK_EQUAL(configStore.getBool("rewrite.report"), true);
    BOOST_CHECK_EQUAL(configStore.getBool("rewrite.missing", true), true);
    BOOST_CHECK_EQUAL(configStore.getBool("rewrite.empty", true), true);
    BOOST_CHECK_THROW(configStore.getBool("rewrite.stages"), util::InvalidBooleanValue);

    std::ostringstream os;
    os << configStore;
    BOOST_CHECK(os.str().find("rewrite.stages") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(BooleanSpellings) {
    std::map<std::string, bool> const spellings = {{"true", true},  {"ON", true},   {" 1 ", true},
                                                   {"no", false},   {"Off", false}, {"0", false}};
    for (auto const& [spelling, expected] : spellings) {
        util::ConfigStore const configStore(std::map<std::string, std::string>{{"rewrite.report", spelling}});
        BOOST_CHECK_EQUAL(configStore.getBool("rewrite.report", not expected), expected);
    }
}

BOOST_AUTO_TEST_CASE(ConfigStoreIniFileTest) {
    std::string const path = "testConfigStore.ini";
    {
        std::ofstream out(path);
        out << "[rewrite]\n"
            << "stages = presto\n"
            << "report = false\n";
    }
    util::ConfigStore const configStore(path);
    BOOST_CHECK_EQUAL(configStore.get("rewrite.stages"), "presto");
    BOOST_CHECK_EQUAL(configStore.getBool("rewrite.report", true), false);
    std::remove(path.c_str());

    BOOST_CHECK_THROW(util::ConfigStore("/nonexistent/sqlrw.cnf"), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()
