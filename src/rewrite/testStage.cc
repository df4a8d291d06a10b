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
#include <sstream>
#include <string>
#include <vector>

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "parser/ParseException.h"
#include "parser/StatementParser.h"
#include "rewrite/Stage.h"
#include "rewrite/StageWalker.h"
#include "util/String.h"

// Boost unit test header
#define BOOST_TEST_MODULE Stage
#include <boost/test/unit_test.hpp>

namespace test = boost::test_tools;
namespace parser = lsst::sqlrw::parser;
namespace rewrite = lsst::sqlrw::rewrite;
namespace util = lsst::sqlrw::util;

using rewrite::EditLedger;
using rewrite::RuleOutcome;
using rewrite::TokenView;

namespace {

std::string nodeText(antlr4::ParserRuleContext* ctx, TokenView const& tokens) {
    return tokens.getText(rewrite::startIndex(ctx), rewrite::stopIndex(ctx));
}

/// Records the visits of query specifications and column references.
void addTracingRules(rewrite::Stage& stage, std::vector<std::string>& trace) {
    stage.onEnter<HiveSqlParser::QuerySpecificationContext>(
            "trace", [&trace](HiveSqlParser::QuerySpecificationContext*, TokenView const&, EditLedger&) {
                trace.push_back("enter query");
                return RuleOutcome::noMatch();
            });
    stage.onExit<HiveSqlParser::QuerySpecificationContext>(
            "trace", [&trace](HiveSqlParser::QuerySpecificationContext*, TokenView const&, EditLedger&) {
                trace.push_back("exit query");
                return RuleOutcome::noMatch();
            });
    stage.onEnter<HiveSqlParser::ColumnReferenceContext>(
            "trace",
            [&trace](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const& tokens, EditLedger&) {
                trace.push_back("enter " + nodeText(ctx, tokens));
                return RuleOutcome::noMatch();
            });
    stage.onExit<HiveSqlParser::ColumnReferenceContext>(
            "trace",
            [&trace](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const& tokens, EditLedger&) {
                trace.push_back("exit " + nodeText(ctx, tokens));
                return RuleOutcome::noMatch();
            });
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(PreAndPostOrder) {
    parser::StatementParser statementParser("SELECT a, b FROM t WHERE c > 1");
    rewrite::Stage stage("trace", statementParser.getTokens());
    std::vector<std::string> trace;
    addTracingRules(stage, trace);
    BOOST_CHECK_EQUAL(stage.getRuleCount(), 4U);

    rewrite::StageWalker(stage).walk(statementParser.parse());
    LOGS_DEBUG("trace: " << util::String::toString(trace, ", "));
    std::vector<std::string> const expected = {"enter query", "enter a", "exit a", "enter b",
                                               "exit b",     "enter c", "exit c", "exit query"};
    BOOST_CHECK_EQUAL_COLLECTIONS(trace.begin(), trace.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(stage.getAppliedCount(), 0U);
    BOOST_CHECK(stage.getLedger().empty());
}

BOOST_AUTO_TEST_CASE(NestedQueries) {
    parser::StatementParser statementParser("SELECT x FROM (SELECT y FROM t) s");
    rewrite::Stage stage("trace", statementParser.getTokens());
    std::vector<std::string> trace;
    addTracingRules(stage, trace);
    rewrite::StageWalker(stage).walk(statementParser.parse());
    std::vector<std::string> const expected = {"enter query", "enter x",   "exit x",   "enter query",
                                               "enter y",    "exit y",    "exit query", "exit query"};
    BOOST_CHECK_EQUAL_COLLECTIONS(trace.begin(), trace.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(RulesRunInRegistrationOrder) {
    parser::StatementParser statementParser("SELECT a FROM t");
    rewrite::Stage stage("upper", statementParser.getTokens());
    stage.onEnter<HiveSqlParser::ColumnReferenceContext>(
            "first", [](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const&, EditLedger& ledger) {
                ledger.insertBefore(rewrite::startIndex(ctx), "1");
                return RuleOutcome::applied();
            });
    stage.onEnter<HiveSqlParser::ColumnReferenceContext>(
            "second", [](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const&, EditLedger& ledger) {
                ledger.insertBefore(rewrite::startIndex(ctx), "2");
                return RuleOutcome::applied();
            });
    rewrite::StageWalker(stage).walk(statementParser.parse());
    BOOST_CHECK_EQUAL(stage.getAppliedCount(), 2U);
    BOOST_CHECK_EQUAL(stage.getLedger().size(), 2U);
    BOOST_CHECK_EQUAL(stage.materialize(), "SELECT 12a FROM t");
}

BOOST_AUTO_TEST_CASE(UnsupportedAbortsTheWalk) {
    parser::StatementParser statementParser("SELECT a, b FROM t");
    rewrite::Stage stage("strict", statementParser.getTokens());
    std::vector<std::string> visited;
    stage.onEnter<HiveSqlParser::ColumnReferenceContext>(
            "no-b",
            [&visited](HiveSqlParser::ColumnReferenceContext* ctx, TokenView const& tokens, EditLedger&) {
                std::string const text = nodeText(ctx, tokens);
                visited.push_back(text);
                if (text == "b") return RuleOutcome::unsupported("column b");
                return RuleOutcome::noMatch();
            });
    rewrite::StageWalker walker(stage);
    BOOST_CHECK_EXCEPTION(walker.walk(statementParser.parse()), parser::UnsupportedConstructError,
                          [](parser::UnsupportedConstructError const& ex) {
                              std::string const what = ex.what();
                              return what.find("no-b") != std::string::npos &&
                                     what.find("column b") != std::string::npos;
                          });
    BOOST_CHECK_EQUAL(visited.size(), 2U);
}

BOOST_AUTO_TEST_CASE(OutcomePrinting) {
    std::ostringstream os;
    os << RuleOutcome::noMatch() << " " << RuleOutcome::applied() << " " << RuleOutcome::unsupported("why");
    BOOST_CHECK_EQUAL(os.str(), "NO_MATCH APPLIED UNSUPPORTED(why)");
    BOOST_CHECK(RuleOutcome::unsupported("x").isUnsupported());
    BOOST_CHECK_EQUAL(RuleOutcome::unsupported("x").getReason(), "x");
}

BOOST_AUTO_TEST_SUITE_END()
