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
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "parser/HiveSqlParser.h"
#include "rewrite/Pipeline.h"
#include "rewrite/Stage.h"
#include "util/Bug.h"

// Boost unit test header
#define BOOST_TEST_MODULE Pipeline
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace rewrite = lsst::sqlrw::rewrite;
namespace util = lsst::sqlrw::util;

using rewrite::EditLedger;
using rewrite::RuleOutcome;
using rewrite::StageReport;
using rewrite::TokenView;

namespace {

/// Renames every column reference `from` to `to`.
rewrite::StageFactory renameStage(std::string const& name, std::string const& from, std::string const& to) {
    return [name, from, to](antlr4::TokenStream* tokens) {
        auto stage = std::make_shared<rewrite::Stage>(name, tokens);
        stage->onEnter<HiveSqlParser::ColumnReferenceContext>(
                "rename", [from, to](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const& view,
                                     EditLedger& ledger) {
                    size_t const index = rewrite::startIndex(ctx);
                    if (view.getText(index) != from) return RuleOutcome::noMatch();
                    ledger.replace(index, to);
                    return RuleOutcome::applied();
                });
        return stage;
    };
}

/// Upper-cases column references.
rewrite::StageFactory upperStage() {
    return [](antlr4::TokenStream* tokens) {
        auto stage = std::make_shared<rewrite::Stage>("upper", tokens);
        stage->onEnter<HiveSqlParser::ColumnReferenceContext>(
                "upper",
                [](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const& view, EditLedger& ledger) {
                    size_t const index = rewrite::startIndex(ctx);
                    std::string text = view.getText(index);
                    for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                    ledger.replace(index, text);
                    return RuleOutcome::applied();
                });
        return stage;
    };
}

/// Fails on every query specification.
rewrite::StageFactory failingStage() {
    return [](antlr4::TokenStream* tokens) {
        auto stage = std::make_shared<rewrite::Stage>("failing", tokens);
        stage->onEnter<HiveSqlParser::QuerySpecificationContext>(
                "refuse", [](HiveSqlParser::QuerySpecificationContext*, TokenView const&, EditLedger& ledger) {
                    ledger.insertBefore(0, "never seen ");
                    return RuleOutcome::unsupported("refusing every query");
                });
        return stage;
    };
}

/// Records two partially overlapping ranges.
rewrite::StageFactory conflictingStage() {
    return [](antlr4::TokenStream* tokens) {
        auto stage = std::make_shared<rewrite::Stage>("conflicting", tokens);
        stage->onEnter<HiveSqlParser::QuerySpecificationContext>(
                "overlap", [](HiveSqlParser::QuerySpecificationContext* ctx, TokenView const&,
                              EditLedger& ledger) {
                    size_t const start = rewrite::startIndex(ctx);
                    ledger.replace(start, start + 2, "x");
                    ledger.replace(start + 2, start + 4, "y");
                    return RuleOutcome::applied();
                });
        return stage;
    };
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(NoStages) {
    rewrite::Pipeline const pipeline;
    BOOST_CHECK_EQUAL(pipeline.rewrite("SELECT a FROM t", {}), "SELECT a FROM t");
}

BOOST_AUTO_TEST_CASE(StagesAreChained) {
    rewrite::Pipeline const pipeline(LOG_GET("lsst.sqlrw.rewrite.testPipeline"));
    auto const result =
            pipeline.run("SELECT a FROM t", {renameStage("first", "a", "b"), renameStage("second", "b", "c")});
    BOOST_CHECK_EQUAL(result.text, "SELECT c FROM t");
    BOOST_REQUIRE_EQUAL(result.stages.size(), 2U);
    BOOST_CHECK_EQUAL(result.stages[0].name, "first");
    BOOST_CHECK_EQUAL(result.stages[1].name, "second");
    BOOST_CHECK_EQUAL(result.stages[1].status, StageReport::APPLIED);
    BOOST_CHECK_EQUAL(result.stages[1].edits, 1U);
    BOOST_CHECK_EQUAL(result.numSkipped(), 0U);
}

BOOST_AUTO_TEST_CASE(FailingStageIsIsolated) {
    rewrite::Pipeline const pipeline;
    std::string const sql = "SELECT a, b FROM t";
    std::string const expected = pipeline.rewrite(sql, {upperStage()});
    BOOST_CHECK_EQUAL(expected, "SELECT A, B FROM t");
    BOOST_CHECK_EQUAL(pipeline.rewrite(sql, {failingStage(), upperStage()}), expected);
    BOOST_CHECK_EQUAL(pipeline.rewrite(sql, {upperStage(), failingStage()}), expected);
    BOOST_CHECK_EQUAL(pipeline.rewrite(sql, {failingStage()}), sql);

    auto const result = pipeline.run(sql, {failingStage(), upperStage()});
    BOOST_REQUIRE_EQUAL(result.stages.size(), 2U);
    BOOST_CHECK_EQUAL(result.stages[0].status, StageReport::SKIPPED);
    BOOST_CHECK(result.stages[0].error.find("refusing every query") != std::string::npos);
    BOOST_CHECK_EQUAL(result.stages[1].status, StageReport::APPLIED);
    BOOST_CHECK_EQUAL(result.numSkipped(), 1U);
}

BOOST_AUTO_TEST_CASE(MalformedInputPassesThrough) {
    rewrite::Pipeline const pipeline;
    for (std::string const sql : {"SELECT FROM", "SELECT a # b", ""}) {
        std::string output;
        BOOST_REQUIRE_NO_THROW(output = pipeline.rewrite(sql, {upperStage(), renameStage("r", "a", "b")}));
        BOOST_CHECK_EQUAL(output, sql);
    }
    auto const result = pipeline.run("SELECT FROM", {upperStage()});
    BOOST_REQUIRE_EQUAL(result.stages.size(), 1U);
    BOOST_CHECK_EQUAL(result.stages[0].status, StageReport::SKIPPED);
    BOOST_CHECK(not result.stages[0].error.empty());
}

BOOST_AUTO_TEST_CASE(FactoryFailureIsIsolated) {
    rewrite::Pipeline const pipeline;
    rewrite::StageFactory const broken = [](antlr4::TokenStream*) -> rewrite::Stage::Ptr {
        throw std::runtime_error("no stage today");
    };
    auto const result = pipeline.run("SELECT a FROM t", {broken, upperStage()});
    BOOST_CHECK_EQUAL(result.text, "SELECT A FROM t");
    BOOST_CHECK_EQUAL(result.stages[0].name, "stage[0]");
    BOOST_CHECK_EQUAL(result.stages[0].error, "no stage today");
}

BOOST_AUTO_TEST_CASE(ConflictingEditsPropagate) {
    rewrite::Pipeline const pipeline;
    BOOST_CHECK_THROW(pipeline.rewrite("SELECT a, b FROM t", {upperStage(), conflictingStage()}), util::Bug);
}

BOOST_AUTO_TEST_CASE(ReportJson) {
    rewrite::Pipeline const pipeline;
    auto const result = pipeline.run("SELECT a FROM t", {failingStage(), upperStage()});
    auto const json = result.toJson();
    LOGS_DEBUG("report: " << json.dump());
    BOOST_CHECK_EQUAL(json["text"].get<std::string>(), "SELECT A FROM t");
    BOOST_REQUIRE_EQUAL(json["stages"].size(), 2U);
    BOOST_CHECK_EQUAL(json["stages"][0]["name"].get<std::string>(), "failing");
    BOOST_CHECK_EQUAL(json["stages"][0]["status"].get<std::string>(), "SKIPPED");
    BOOST_CHECK(json["stages"][0].contains("error"));
    BOOST_CHECK_EQUAL(json["stages"][1]["status"].get<std::string>(), "APPLIED");
    BOOST_CHECK_EQUAL(json["stages"][1]["rules_applied"].get<size_t>(), 1U);
    BOOST_CHECK(not json["stages"][1].contains("error"));
}

BOOST_AUTO_TEST_CASE(Validation) {
    BOOST_CHECK(rewrite::Pipeline::isValid("SELECT a FROM t LATERAL VIEW explode(b) t2 AS c"));
    BOOST_CHECK(not rewrite::Pipeline::isValid("SELECT FROM"));
}

BOOST_AUTO_TEST_SUITE_END()
