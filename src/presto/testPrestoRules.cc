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
#include <ostream>
#include <string>
#include <vector>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "presto/PrestoStage.h"
#include "rewrite/Pipeline.h"
#include "rewrite/RewriteConfig.h"
#include "rewrite/StageRegistry.h"

// Boost unit test header
#define BOOST_TEST_MODULE PrestoRules
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>

namespace test = boost::test_tools;
namespace presto = lsst::sqlrw::presto;
namespace rewrite = lsst::sqlrw::rewrite;

namespace {

std::string toPresto(std::string const& hive) {
    rewrite::Pipeline const pipeline;
    return pipeline.rewrite(hive, {presto::makePrestoStage});
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

struct Translation {
    Translation(std::string const& hive_, std::string const& presto_) : hive(hive_), presto(presto_) {}

    std::string hive;
    std::string presto;
};

std::ostream& operator<<(std::ostream& os, Translation const& t) {
    os << "Translation(" << t.hive << " -> " << t.presto << ")";
    return os;
}

static std::vector<Translation> const TRANSLATIONS = {
        // regular expression match operators
        Translation("SELECT a FROM t WHERE a RLIKE '.*'", "SELECT a FROM t WHERE regexp_like(a, '.*')"),
        Translation("SELECT a FROM t WHERE a NOT REGEXP 'x'", "SELECT a FROM t WHERE not regexp_like(a, 'x')"),
        Translation("select a from t where a rlike 'x'", "select a from t where regexp_like(a, 'x')"),
        Translation("SELECT a FROM t WHERE NOT a RLIKE 'x'", "SELECT a FROM t WHERE NOT regexp_like(a, 'x')"),
        Translation("SELECT a FROM t WHERE a NOT RLIKE 'x' AND NOT b REGEXP 'y'",
                    "SELECT a FROM t WHERE not regexp_like(a, 'x') AND NOT regexp_like(b, 'y')"),
        Translation("SELECT a FROM t WHERE a LIKE 'x%'", "SELECT a FROM t WHERE a LIKE 'x%'"),

        // modulo
        Translation("SELECT 7 % 2", "SELECT mod(7, 2)"),
        Translation("SELECT a % b % c FROM t", "SELECT mod(mod(a, b), c) FROM t"),
        Translation("SELECT a FROM t WHERE a % 2 RLIKE 'x'", "SELECT a FROM t WHERE regexp_like(mod(a, 2), 'x')"),
        Translation("SELECT (a + 1) % 3 FROM t", "SELECT mod((a + 1), 3) FROM t"),

        // array constructor
        Translation("SELECT array(1, 2, 3)", "SELECT array[1, 2, 3]"),
        Translation("SELECT ARRAY (1, 2)", "SELECT ARRAY[1, 2]"),
        Translation("SELECT array /* list */ (a)", "SELECT array[a]"),
        Translation("SELECT array()", "SELECT array[]"),

        // string type
        Translation("CREATE TABLE t (c STRING)", "CREATE TABLE t (c varchar)"),
        Translation("CREATE TABLE t (c array<string>, d map<string, int>)",
                    "CREATE TABLE t (c array<varchar>, d map<varchar, int>)"),
        Translation("SELECT CAST(a AS STRING) FROM t", "SELECT CAST(a AS varchar) FROM t"),

        // identifiers
        Translation("SELECT `col` FROM t", "SELECT \"col\" FROM t"),
        Translation("SELECT `a``b` FROM t", "SELECT \"a``b\" FROM t"),
        Translation("SELECT 1col FROM t", "SELECT \"1col\" FROM t"),
        Translation("SELECT db.fn(a) FROM t", "SELECT \"db.fn\"(a) FROM t"),
        Translation("SELECT `db`.`fn`(a) FROM t", "SELECT \"db.fn\"(a) FROM t"),
        Translation("SELECT fn(a) FROM t", "SELECT fn(a) FROM t"),

        // string literals
        Translation("SELECT \"it's\" FROM t", "SELECT 'it''s' FROM t"),
        Translation("SELECT \"say \\\"hi\\\"\" FROM t", "SELECT 'say \"hi\"' FROM t"),
        Translation("SELECT 'a' \"b\" FROM t", "SELECT 'a' 'b' FROM t"),
        Translation("CREATE TABLE t (c STRING COMMENT \"it's\") COMMENT \"d\"",
                    "CREATE TABLE t (c varchar COMMENT 'it''s') COMMENT 'd'"),
        Translation("CREATE TABLE t (c struct<f:int COMMENT \"x\">)",
                    "CREATE TABLE t (c struct<f:int COMMENT 'x'>)"),
        Translation("CREATE TABLE t (c INT COMMENT 'kept')", "CREATE TABLE t (c INT COMMENT 'kept')"),

        // query organization
        Translation("SELECT * FROM t SORT BY a", "SELECT * FROM t order BY a"),
        Translation("SELECT * FROM t CLUSTER BY a", "SELECT * FROM t"),
        Translation("SELECT * FROM t CLUSTER BY a, b LIMIT 1", "SELECT * FROM t LIMIT 1"),
        Translation("SELECT * FROM t DISTRIBUTE BY a SORT BY b DESC", "SELECT * FROM t order BY b DESC"),
        Translation("SELECT * FROM t DISTRIBUTE BY a;", "SELECT * FROM t;"),

        // lateral view
        Translation("SELECT a FROM t LATERAL VIEW explode(b) t2 AS c",
                    "SELECT a FROM t cross join unnest(b) as t2 (c)"),
        Translation("SELECT a FROM t LATERAL VIEW explode(b) t2 c", "SELECT a FROM t cross join unnest(b) as t2 (c)"),
        Translation("SELECT k FROM t LATERAL VIEW EXPLODE(m) t2 AS k, v",
                    "SELECT k FROM t cross join unnest(m) as t2 (k, v)"),
        Translation("SELECT a FROM t LATERAL VIEW explode(b) t2", "SELECT a FROM t cross join unnest(b) as t2"),

        // several rules at once
        Translation("SELECT `x`, y % 2 FROM t LATERAL VIEW explode(b) t2 AS c WHERE c RLIKE \"^a\" SORT BY `x`",
                    "SELECT \"x\", mod(y, 2) FROM t cross join unnest(b) as t2 (c) WHERE regexp_like(c, '^a') "
                    "order BY \"x\""),
};

BOOST_DATA_TEST_CASE(HiveToPresto, TRANSLATIONS, translation) {
    BOOST_CHECK_EQUAL(toPresto(translation.hive), translation.presto);
}

// Statements the stage gives up on come back unchanged.
static std::vector<std::string> const PASS_THROUGH = {
        "SELECT FROM",
        "SELECT a FROM t LATERAL VIEW posexplode(b) t2 AS p, c",
        "SELECT `x` FROM t LATERAL VIEW inline(b) t2",
        "SELECT a FROM t LATERAL VIEW OUTER explode(b) t2 AS c",
        "SELECT a FROM t WHERE a = 1",
};

BOOST_DATA_TEST_CASE(PassThrough, PASS_THROUGH, hive) { BOOST_CHECK_EQUAL(toPresto(hive), hive); }

// Rewriting the output again changes nothing.
static std::vector<std::string> const IDEMPOTENT = {
        "SELECT a FROM t WHERE a NOT REGEXP 'x'",
        "SELECT 7 % 2",
        "SELECT array(1, 2, 3)",
        "CREATE TABLE t (c STRING)",
        "SELECT * FROM t SORT BY a",
        "SELECT * FROM t CLUSTER BY a",
        "SELECT a FROM t LATERAL VIEW explode(b) t2 AS c",
        "CREATE TABLE t (c STRING COMMENT \"d\")",
};

BOOST_DATA_TEST_CASE(Idempotent, IDEMPOTENT, hive) {
    std::string const once = toPresto(hive);
    BOOST_CHECK_EQUAL(toPresto(once), once);
}

// Quoted identifiers of the output read as Hive double-quoted strings, so a second
// pass turns them into string literals.
static std::vector<Translation> const TWICE = {
        Translation("SELECT `col` FROM t", "SELECT 'col' FROM t"),
        Translation("SELECT 1col FROM t", "SELECT '1col' FROM t"),
};

BOOST_DATA_TEST_CASE(QuotedIdentifiersRewrittenTwice, TWICE, translation) {
    rewrite::Pipeline const pipeline;
    auto const result = pipeline.run(translation.hive, {presto::makePrestoStage, presto::makePrestoStage});
    BOOST_CHECK_EQUAL(result.text, translation.presto);
    BOOST_REQUIRE_EQUAL(result.stages.size(), 2U);
    BOOST_CHECK_EQUAL(result.stages[1].status, rewrite::StageReport::APPLIED);
    BOOST_CHECK_EQUAL(result.stages[1].rulesApplied, 1U);
}

BOOST_AUTO_TEST_CASE(UnsupportedLateralViewReport) {
    rewrite::Pipeline const pipeline;
    auto const result =
            pipeline.run("SELECT a FROM t LATERAL VIEW json_tuple(b, 'k') t2 AS k", {presto::makePrestoStage});
    BOOST_REQUIRE_EQUAL(result.stages.size(), 1U);
    auto const& report = result.stages[0];
    LOGS_DEBUG("report: " << result.toJson().dump());
    BOOST_CHECK_EQUAL(report.name, presto::PRESTO_STAGE_NAME);
    BOOST_CHECK_EQUAL(report.status, rewrite::StageReport::SKIPPED);
    BOOST_CHECK(report.error.find("lateral-view") != std::string::npos);
    BOOST_CHECK(report.error.find("json_tuple") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(RegisteredStage) {
    rewrite::StageRegistry registry;
    presto::registerStages(registry);
    BOOST_CHECK(registry.has("presto"));

    rewrite::RewriteConfig const config;
    rewrite::Pipeline const pipeline;
    auto const result = pipeline.run("SELECT a FROM t WHERE a RLIKE '.*'", config.makeFactories(registry));
    BOOST_CHECK_EQUAL(result.text, "SELECT a FROM t WHERE regexp_like(a, '.*')");
    BOOST_REQUIRE_EQUAL(result.stages.size(), 1U);
    BOOST_CHECK_EQUAL(result.stages[0].status, rewrite::StageReport::APPLIED);
    BOOST_CHECK_EQUAL(result.stages[0].edits, 4U);
    BOOST_CHECK_EQUAL(result.stages[0].rulesApplied, 2U);
}

BOOST_AUTO_TEST_SUITE_END()
