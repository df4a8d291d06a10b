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
#include "presto/IdentifierRules.h"

// System headers
#include <cctype>
#include <vector>

// Sqlrw headers
#include "parser/HiveSqlParser.h"
#include "rewrite/Stage.h"

using lsst::sqlrw::rewrite::EditLedger;
using lsst::sqlrw::rewrite::RuleOutcome;
using lsst::sqlrw::rewrite::startIndex;
using lsst::sqlrw::rewrite::stopIndex;
using lsst::sqlrw::rewrite::tokenIndex;
using lsst::sqlrw::rewrite::TokenView;

namespace {

/// @return the name without its back-quotes, with doubled back-quotes collapsed.
std::string unquote(std::string const& name) {
    if (name.size() < 2 || name.front() != '`' || name.back() != '`') return name;
    std::string result;
    for (size_t i = 1; i + 1 < name.size(); ++i) {
        result += name[i];
        if (name[i] == '`' && name[i + 1] == '`' && i + 2 < name.size()) ++i;
    }
    return result;
}

// `name` -> "name", the interior is kept as is.
RuleOutcome enterQuotedIdentifier(HiveSqlParser::QuotedIdentifierContext* ctx, TokenView const& tokens,
                                  EditLedger& ledger) {
    size_t const index = tokenIndex(ctx->BACKQUOTED_IDENTIFIER());
    std::string text = tokens.getText(index);
    if (text.size() < 2) return RuleOutcome::noMatch();
    text.front() = '"';
    text.back() = '"';
    ledger.replace(index, text);
    return RuleOutcome::applied();
}

RuleOutcome enterLeadingDigitIdentifier(HiveSqlParser::UnquotedIdentifierContext* ctx, TokenView const& tokens,
                                        EditLedger& ledger) {
    if (ctx->IDENTIFIER() == nullptr) return RuleOutcome::noMatch();
    size_t const index = tokenIndex(ctx->IDENTIFIER());
    std::string const text = tokens.getText(index);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) return RuleOutcome::noMatch();
    ledger.replace(index, "\"" + text + "\"");
    return RuleOutcome::applied();
}

// db.fn(x) -> "db.fn"(x). Replaces the quoting of the individual segments.
RuleOutcome exitDottedFunctionName(HiveSqlParser::FunctionCallContext* ctx, TokenView const& tokens,
                                   EditLedger& ledger) {
    auto const qualifiedName = ctx->functionName()->qualifiedName();
    std::vector<HiveSqlParser::IdentifierContext*> const segments = qualifiedName->identifier();
    if (segments.size() < 2) return RuleOutcome::noMatch();
    std::string name;
    for (auto const segment : segments) {
        if (!name.empty()) name += ".";
        name += unquote(tokens.getText(startIndex(segment), stopIndex(segment)));
    }
    ledger.replace(startIndex(qualifiedName), stopIndex(qualifiedName), "\"" + name + "\"");
    return RuleOutcome::applied();
}

}  // namespace

namespace lsst::sqlrw::presto {

void addIdentifierRules(rewrite::Stage& stage) {
    stage.onEnter<HiveSqlParser::QuotedIdentifierContext>("backquoted-identifier", enterQuotedIdentifier);
    stage.onEnter<HiveSqlParser::UnquotedIdentifierContext>("leading-digit-identifier",
                                                            enterLeadingDigitIdentifier);
    stage.onExit<HiveSqlParser::FunctionCallContext>("dotted-function-name", exitDottedFunctionName);
}

}  // namespace lsst::sqlrw::presto
