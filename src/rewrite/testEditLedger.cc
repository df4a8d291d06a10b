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
#include "parser/StatementParser.h"
#include "rewrite/EditLedger.h"
#include "rewrite/TokenView.h"
#include "util/Bug.h"

// Boost unit test header
#define BOOST_TEST_MODULE EditLedger
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>

namespace test = boost::test_tools;
using lsst::sqlrw::parser::StatementParser;
using lsst::sqlrw::rewrite::EditLedger;
using lsst::sqlrw::rewrite::TokenView;
namespace util = lsst::sqlrw::util;

namespace {

// Token indexes of SIMPLE: 0 SELECT, 1 ' ', 2 a, 3 ' ', 4 FROM, 5 ' ', 6 t, 7 EOF
std::string const SIMPLE = "SELECT a FROM t";

struct Fixture {
    explicit Fixture(std::string const& statement = SIMPLE) : parser(statement), tokens(parser.getTokens()) {}

    StatementParser parser;
    TokenView tokens;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(Suite)

static std::vector<std::string> const STATEMENTS = {
        SIMPLE,
        "  select\ta ,b -- trailing\nfrom /* x */ t  ",
        "SELECT `a b`, \"it's\" FROM t CLUSTER BY a;",
        "",
};

BOOST_DATA_TEST_CASE(EmptyLedgerReproducesInput, STATEMENTS, statement) {
    Fixture f(statement);
    EditLedger ledger;
    BOOST_CHECK(ledger.empty());
    BOOST_CHECK_EQUAL(ledger.materialize(f.tokens), statement);
}

BOOST_FIXTURE_TEST_CASE(TokenViewAccess, Fixture) {
    BOOST_REQUIRE_EQUAL(tokens.size(), 8U);
    BOOST_CHECK_EQUAL(tokens.getText(0), "SELECT");
    BOOST_CHECK(tokens.isTrivia(1));
    BOOST_CHECK(not tokens.isTrivia(2));
    BOOST_CHECK(tokens.isEof(7));
    BOOST_CHECK_EQUAL(tokens.getText(7), "");
    BOOST_CHECK_EQUAL(tokens.getText(2, 7), "a FROM t");
    BOOST_CHECK_EQUAL(tokens.find(0, "from"), 4U);
    BOOST_CHECK_EQUAL(tokens.find(5, "from"), TokenView::npos);
    BOOST_CHECK_THROW(tokens.get(8), util::Bug);
}

BOOST_FIXTURE_TEST_CASE(InsertsKeepRecordingOrder, Fixture) {
    EditLedger ledger;
    ledger.insertBefore(2, "x");
    ledger.insertAfter(2, "1");
    ledger.insertBefore(2, "y");
    ledger.insertAfter(2, "2");
    ledger.insertAfter(7, ";");
    BOOST_CHECK_EQUAL(ledger.size(), 5U);
    BOOST_CHECK_EQUAL(ledger.getEdits(2).size(), 4U);
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT xya12 FROM t;");
}

BOOST_FIXTURE_TEST_CASE(ReplaceRange, Fixture) {
    EditLedger ledger;
    ledger.insertBefore(2, "<");
    ledger.replace(2, 6, "x");
    ledger.insertAfter(4, "dropped");
    ledger.insertBefore(4, "dropped");
    ledger.insertAfter(6, ">");
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT <x>");
}

BOOST_FIXTURE_TEST_CASE(EraseAbsorbsOneTrailingBlank, Fixture) {
    {
        EditLedger ledger;
        ledger.eraseToken(2);
        BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT FROM t");
    }
    {
        EditLedger ledger;
        ledger.erase(2, 2);
        BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT  FROM t");
    }
    {
        // The blank after the last token is EOF, nothing to absorb.
        EditLedger ledger;
        ledger.eraseToken(6);
        BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT a FROM ");
    }
}

BOOST_AUTO_TEST_CASE(AbsorptionSkipsComments) {
    Fixture f("SELECT a/*c*/FROM t");
    EditLedger ledger;
    ledger.eraseToken(2);
    BOOST_CHECK_EQUAL(ledger.materialize(f.tokens), "SELECT /*c*/FROM t");
}

BOOST_FIXTURE_TEST_CASE(BlankPredicateIsConfigurable, Fixture) {
    EditLedger ledger([](std::string const& text) { return text == "never"; });
    ledger.eraseToken(2);
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT  FROM t");
    BOOST_CHECK(EditLedger::isWhitespace(" \t\n"));
    BOOST_CHECK(not EditLedger::isWhitespace(""));
    BOOST_CHECK(not EditLedger::isWhitespace("-- x"));
}

BOOST_FIXTURE_TEST_CASE(InsertsOnDeletedTokensAreDropped, Fixture) {
    EditLedger ledger;
    ledger.erase(2, 2);
    ledger.insertBefore(2, "x");
    ledger.insertAfter(2, "y");
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT  FROM t");
}

BOOST_FIXTURE_TEST_CASE(NestedRangeLosesToOuter, Fixture) {
    {
        EditLedger ledger;
        ledger.replace(2, 6, "X");
        ledger.replace(4, "Y");
        BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT X");
    }
    {
        EditLedger ledger;
        ledger.eraseToken(4);
        ledger.replace(2, 6, "X");
        BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT X");
    }
}

BOOST_FIXTURE_TEST_CASE(SameRangeLaterWins, Fixture) {
    EditLedger ledger;
    ledger.replace(2, "b");
    ledger.replace(2, "c");
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT c FROM t");
}

BOOST_FIXTURE_TEST_CASE(PartialOverlapIsABug, Fixture) {
    EditLedger ledger;
    ledger.replace(2, 4, "x");
    ledger.replace(4, 6, "y");
    BOOST_CHECK_THROW(ledger.materialize(tokens), util::Bug);
}

BOOST_FIXTURE_TEST_CASE(BadAnchorIsABug, Fixture) {
    EditLedger ledger;
    // Recording never fails.
    BOOST_CHECK_NO_THROW(ledger.insertBefore(100, "x"));
    BOOST_CHECK_THROW(ledger.materialize(tokens), util::Bug);
}

BOOST_FIXTURE_TEST_CASE(MaterializeOnce, Fixture) {
    EditLedger ledger;
    ledger.replace(6, "u");
    BOOST_CHECK_EQUAL(ledger.materialize(tokens), "SELECT a FROM u");
    BOOST_CHECK(ledger.isMaterialized());
    BOOST_CHECK_THROW(ledger.materialize(tokens), util::Bug);
}

BOOST_AUTO_TEST_CASE(EditsInRecordingOrder) {
    EditLedger ledger;
    ledger.insertAfter(6, ")");
    ledger.insertBefore(2, "(");
    ledger.eraseToken(4);
    auto const edits = ledger.getEdits();
    BOOST_REQUIRE_EQUAL(edits.size(), 3U);
    BOOST_CHECK_EQUAL(edits[0].kind, EditLedger::Edit::INSERT_AFTER);
    BOOST_CHECK_EQUAL(edits[1].kind, EditLedger::Edit::INSERT_BEFORE);
    BOOST_CHECK_EQUAL(edits[2].kind, EditLedger::Edit::DELETE);
    BOOST_CHECK(edits[2].absorbTrailingBlank);
    std::ostringstream os;
    os << ledger;
    LOGS_DEBUG("ledger: " << os.str());
    BOOST_CHECK_EQUAL(os.str(), "EditLedger(INSERT_AFTER#0[6] \")\", INSERT_BEFORE#1[2] \"(\", DELETE#2[4..4] +blank)");
}

BOOST_AUTO_TEST_SUITE_END()
