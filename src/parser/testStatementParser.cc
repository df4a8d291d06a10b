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

// Third party headers
#include "antlr4-runtime.h"

// LSST headers
#include "lsst/log/Log.h"

// Sqlrw headers
#include "parser/ParseException.h"
#include "parser/StatementParser.h"

// Boost unit test header
#define BOOST_TEST_MODULE StatementParser
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>

namespace test = boost::test_tools;
using lsst::sqlrw::parser::ParseException;
using lsst::sqlrw::parser::StatementParser;

namespace {

/// @return the concatenated text of all tokens but EOF.
std::string tokenText(StatementParser& parser) {
    std::string text;
    for (auto const token : parser.getTokens()->getTokens()) {
        if (token->getType() != antlr4::Token::EOF) text += token->getText();
    }
    return text;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

static std::vector<std::string> const VALID_STATEMENTS = {
        "SELECT a FROM t WHERE a RLIKE '.*'",
        "select A from T where a not regexp 'x'",
        "SELECT a, b AS c FROM db.t x JOIN u ON x.id = u.id WHERE b IS NOT NULL AND a LIKE 'p%'",
        "SELECT count(*) FROM t GROUP BY a HAVING count(*) > 1 ORDER BY a DESC LIMIT 10",
        "WITH q AS (SELECT 1) SELECT * FROM q UNION ALL SELECT * FROM q",
        "CREATE TABLE IF NOT EXISTS t (c STRING, d array<int>, e map<string, int>) COMMENT 'x'",
        "CREATE VIEW v AS SELECT a FROM t",
        "INSERT OVERWRITE TABLE t SELECT CAST(a AS STRING) FROM s",
        "SELECT CASE WHEN a > 1 THEN 'x' ELSE \"y\" END FROM t",
        "SELECT a FROM t LATERAL VIEW explode(b) t2 AS c",
        "SELECT `select`, 1abc FROM t CLUSTER BY a -- trailing comment",
        "SELECT a[0], m['k'], s.f, 7 % 2, array(1, 2, 3) FROM t /* c */ SORT BY a;",
        "SELECT a FROM t DISTRIBUTE BY a SORT BY b",
        "SELECT db.fn(a) FROM t WHERE a BETWEEN 1 AND 2 OR a IN (3, 4)",
};

BOOST_DATA_TEST_CASE(ParseValid, VALID_STATEMENTS, statement) {
    StatementParser parser(statement);
    BOOST_REQUIRE_NO_THROW(parser.parse());
    LOGS_DEBUG("tree: " << parser.getStringTree());
    BOOST_CHECK(StatementParser::isValid(statement));
}

static std::vector<std::string> const INVALID_STATEMENTS = {
        "SELECT FROM",
        "SELECT a FROM t WHERE",
        "SELECT a FROM t LIMIT 5 garbage",
        "SELECT 'unterminated",
        "SELECT a # b FROM t",
        "",
};

BOOST_DATA_TEST_CASE(RejectInvalid, INVALID_STATEMENTS, statement) {
    BOOST_CHECK(not StatementParser::isValid(statement));
}

BOOST_AUTO_TEST_CASE(ParseErrorMessage) {
    StatementParser parser("SELECT FROM");
    BOOST_CHECK_EXCEPTION(parser.parse(), ParseException, [](ParseException const& ex) {
        return std::string(ex.what()) == "Failed to parse statement: \"SELECT FROM\"";
    });
}

BOOST_AUTO_TEST_CASE(LexErrorAtConstruction) {
    BOOST_CHECK_THROW(StatementParser("SELECT a # b"), ParseException);
}

BOOST_AUTO_TEST_CASE(TriviaIsKept) {
    std::string const statement = "SELECT  a -- first column\n\tFROM /* the table */ t\n";
    StatementParser parser(statement);
    BOOST_CHECK_EQUAL(tokenText(parser), statement);

    size_t hidden = 0;
    size_t comments = 0;
    for (auto const token : parser.getTokens()->getTokens()) {
        if (token->getChannel() == antlr4::Token::DEFAULT_CHANNEL) continue;
        ++hidden;
        if (token->getType() == HiveSqlLexer::SIMPLE_COMMENT ||
            token->getType() == HiveSqlLexer::BRACKETED_COMMENT) {
            ++comments;
        }
    }
    BOOST_CHECK_EQUAL(comments, 2U);
    BOOST_CHECK_GT(hidden, comments);

    // Token indexes are the positions in the stream.
    auto const& tokens = parser.getTokens()->getTokens();
    for (size_t i = 0; i < tokens.size(); ++i) {
        BOOST_CHECK_EQUAL(tokens[i]->getTokenIndex(), i);
    }
    BOOST_CHECK_EQUAL(tokens.back()->getType(), antlr4::Token::EOF);
}

BOOST_AUTO_TEST_CASE(KeywordsAreCaseInsensitive) {
    StatementParser parser("sElEcT a FrOm t ClUsTeR bY a");
    auto const pairs = parser.getTokenPairs();
    BOOST_REQUIRE_GE(pairs.size(), 1U);
    BOOST_CHECK_EQUAL(pairs[0].first, "SELECT");
    BOOST_CHECK_EQUAL(pairs[0].second, "sElEcT");
    BOOST_CHECK_NO_THROW(parser.parse());
}

BOOST_AUTO_TEST_CASE(ParseIsCached) {
    StatementParser parser("SELECT 1");
    auto const tree = parser.parse();
    BOOST_CHECK_EQUAL(parser.parse(), tree);
    BOOST_CHECK_EQUAL(parser.getStatement(), "SELECT 1");
}

BOOST_AUTO_TEST_SUITE_END()
