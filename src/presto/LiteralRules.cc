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

// Class header
#include "presto/LiteralRules.h"

// Sqlrw headers
#include "parser/HiveSqlParser.h"
#include "rewrite/Stage.h"
#include "util/String.h"

using lsst::sqlrw::rewrite::EditLedger;
using lsst::sqlrw::rewrite::RuleOutcome;
using lsst::sqlrw::rewrite::startIndex;
using lsst::sqlrw::rewrite::stopIndex;
using lsst::sqlrw::rewrite::tokenIndex;
using lsst::sqlrw::rewrite::TokenView;
namespace util = lsst::sqlrw::util;

namespace {

// array(1, 2) -> array[1, 2]
RuleOutcome enterArrayConstructor(HiveSqlParser::FunctionCallContext* ctx, TokenView const& tokens,
                                  EditLedger& ledger) {
    auto const functionName = ctx->functionName();
    if (functionName->qualifiedName()->identifier().size() != 1) return RuleOutcome::noMatch();
    size_t const nameStop = stopIndex(functionName);
    if (!util::String::equalsIgnoreCase(tokens.getText(startIndex(functionName), nameStop), "array")) {
        return RuleOutcome::noMatch();
    }
    // Comments may sit between the name and the parenthesis.
    size_t const leftParen = tokens.find(nameStop + 1, "(");
    if (leftParen == TokenView::npos) return RuleOutcome::noMatch();
    ledger.replace(nameStop + 1, leftParen, "[");
    ledger.replace(stopIndex(ctx), "]");
    return RuleOutcome::applied();
}

RuleOutcome enterStringType(HiveSqlParser::PrimitiveDataTypeContext* ctx, TokenView const& tokens,
                            EditLedger& ledger) {
    size_t const index = startIndex(ctx);
    if (!util::String::equalsIgnoreCase(tokens.getText(index), "string")) return RuleOutcome::noMatch();
    ledger.replace(index, "varchar");
    return RuleOutcome::applied();
}

/// @return the double-quoted literal as a single-quoted one.
std::string toSingleQuoted(std::string const& literal) {
    std::string result = "'";
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        char const c = literal[i];
        if (c == '\\' && i + 2 < literal.size()) {
            char const next = literal[i + 1];
            if (next == '"') {
                result += '"';
                ++i;
                continue;
            }
            result += c;
            result += next;
            ++i;
            continue;
        }
        if (c == '\'') {
            result += "''";
            continue;
        }
        result += c;
    }
    result += "'";
    return result;
}

/// Single-quote the string token if it is double-quoted. @return true if an edit was recorded
bool requoteString(size_t index, TokenView const& tokens, EditLedger& ledger) {
    std::string const text = tokens.getText(index);
    if (text.size() < 2 || text.front() != '"') return false;
    ledger.replace(index, toSingleQuoted(text));
    return true;
}

RuleOutcome exitDoubleQuotedString(HiveSqlParser::StringLiteralContext* ctx, TokenView const& tokens,
                                   EditLedger& ledger) {
    bool applied = false;
    for (auto const node : ctx->STRING()) {
        if (requoteString(tokenIndex(node), tokens, ledger)) applied = true;
    }
    return applied ? RuleOutcome::applied() : RuleOutcome::noMatch();
}

// Table and column comments are bare STRING tokens rather than literals.
template <typename Context>
RuleOutcome exitDoubleQuotedComment(Context* ctx, TokenView const& tokens, EditLedger& ledger) {
    if (ctx->comment == nullptr) return RuleOutcome::noMatch();
    return requoteString(tokenIndex(ctx->comment), tokens, ledger) ? RuleOutcome::applied()
                                                                   : RuleOutcome::noMatch();
}

}  // namespace

namespace lsst::sqlrw::presto {

void addLiteralRules(rewrite::Stage& stage) {
    stage.onEnter<HiveSqlParser::FunctionCallContext>("array-constructor", enterArrayConstructor);
    stage.onEnter<HiveSqlParser::PrimitiveDataTypeContext>("string-type", enterStringType);
    stage.onExit<HiveSqlParser::StringLiteralContext>("double-quoted-string", exitDoubleQuotedString);
    stage.onExit<HiveSqlParser::CreateTableContext>("double-quoted-string",
                                                    exitDoubleQuotedComment<HiveSqlParser::CreateTableContext>);
    stage.onExit<HiveSqlParser::ColTypeContext>("double-quoted-string",
                                                exitDoubleQuotedComment<HiveSqlParser::ColTypeContext>);
    stage.onExit<HiveSqlParser::ComplexColTypeContext>(
            "double-quoted-string", exitDoubleQuotedComment<HiveSqlParser::ComplexColTypeContext>);
}

}  // namespace lsst::sqlrw::presto
