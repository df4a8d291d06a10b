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
#include <map>
#include <memory>
#include <string>
#include <vector>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "rewrite/RewriteConfig.h"
#include "rewrite/RewriteConfigError.h"
#include "rewrite/StageRegistry.h"
#include "util/ConfigStore.h"
#include "util/ConfigStoreError.h"

// Boost unit test header
#define BOOST_TEST_MODULE RewriteConfig
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace rewrite = lsst::sqlrw::rewrite;
namespace util = lsst::sqlrw::util;

namespace {

rewrite::StageFactory namedFactory(std::string const& name) {
    return [name](antlr4::TokenStream* tokens) { return std::make_shared<rewrite::Stage>(name, tokens); };
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(Defaults) {
    rewrite::RewriteConfig const config;
    BOOST_REQUIRE_EQUAL(config.getStages().size(), 1U);
    BOOST_CHECK_EQUAL(config.getStages()[0], "presto");
    BOOST_CHECK(not config.getReport());

    // An empty [rewrite] section gives the defaults too.
    rewrite::RewriteConfig const fromEmpty{util::ConfigStore()};
    BOOST_CHECK_EQUAL(fromEmpty.toJson(), config.toJson());
}

BOOST_AUTO_TEST_CASE(FromConfigStore) {
    util::ConfigStore const configStore(std::map<std::string, std::string>{
            {"rewrite.stages", " presto , extra ,"}, {"rewrite.report", "on"}});
    rewrite::RewriteConfig config(configStore);
    std::vector<std::string> const expected = {"presto", "extra"};
    BOOST_CHECK_EQUAL_COLLECTIONS(config.getStages().begin(), config.getStages().end(), expected.begin(),
                                  expected.end());
    BOOST_CHECK(config.getReport());
    LOGS_DEBUG("config: " << config);
    BOOST_CHECK_EQUAL(config.toJson().dump(), "{\"report\":true,\"stages\":[\"presto\",\"extra\"]}");

    config.setStages("extra");
    BOOST_REQUIRE_EQUAL(config.getStages().size(), 1U);
    BOOST_CHECK_EQUAL(config.getStages()[0], "extra");
    BOOST_CHECK_THROW(config.setStages(" , "), rewrite::RewriteConfigError);
}

BOOST_AUTO_TEST_CASE(InvalidValues) {
    BOOST_CHECK_THROW(rewrite::RewriteConfig(util::ConfigStore(std::map<std::string, std::string>{
                              {"rewrite.stages", ","}})),
                      rewrite::RewriteConfigError);
    BOOST_CHECK_THROW(rewrite::RewriteConfig(util::ConfigStore(std::map<std::string, std::string>{
                              {"rewrite.report", "maybe"}})),
                      util::InvalidBooleanValue);
}

BOOST_AUTO_TEST_CASE(Registry) {
    rewrite::StageRegistry registry;
    registry.add("presto", namedFactory("presto"));
    registry.add("extra", namedFactory("extra"));
    BOOST_CHECK(registry.has("presto"));
    BOOST_CHECK(not registry.has("spark"));
    BOOST_CHECK_THROW(registry.add("presto", namedFactory("again")), rewrite::RewriteConfigError);
    BOOST_CHECK_THROW(registry.add("", namedFactory("anonymous")), rewrite::RewriteConfigError);
    BOOST_CHECK_THROW(registry.get("spark"), rewrite::RewriteConfigError);

    std::vector<std::string> const names = {"extra", "presto"};
    auto const registered = registry.getNames();
    BOOST_CHECK_EQUAL_COLLECTIONS(registered.begin(), registered.end(), names.begin(), names.end());

    rewrite::RewriteConfig config;
    config.setStages("extra,presto,extra");
    auto const factories = config.makeFactories(registry);
    BOOST_REQUIRE_EQUAL(factories.size(), 3U);

    config.setStages("presto,spark");
    BOOST_CHECK_THROW(config.makeFactories(registry), rewrite::RewriteConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
