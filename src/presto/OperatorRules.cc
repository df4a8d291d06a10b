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
#include "presto/OperatorRules.h"

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

bool isRegexpMatch(HiveSqlParser::PredicateContext* predicate) {
    if (predicate == nullptr || predicate->kind == nullptr) return false;
    size_t const kind = predicate->kind->getType();
    return kind == HiveSqlParser::RLIKE || kind == HiveSqlParser::REGEXP;
}

// `a [NOT] RLIKE p`: open the call before the left operand, drop the keywords.
RuleOutcome enterRegexpMatch(HiveSqlParser::PredicatedContext* ctx, TokenView const&, EditLedger& ledger) {
    auto const predicate = ctx->predicate();
    if (!isRegexpMatch(predicate)) return RuleOutcome::noMatch();
    std::string call = "regexp_like(";
    if (predicate->NOT() != nullptr) {
        call = "not " + call;
        ledger.eraseToken(tokenIndex(predicate->NOT()));
    }
    ledger.insertBefore(startIndex(ctx), call);
    ledger.eraseToken(tokenIndex(predicate->kind));
    return RuleOutcome::applied();
}

RuleOutcome exitRegexpMatch(HiveSqlParser::PredicatedContext* ctx, TokenView const&, EditLedger& ledger) {
    auto const predicate = ctx->predicate();
    if (!isRegexpMatch(predicate)) return RuleOutcome::noMatch();
    ledger.insertAfter(stopIndex(ctx->valueExpression()), ",");
    ledger.insertAfter(stopIndex(predicate), ")");
    return RuleOutcome::applied();
}

bool isModulo(HiveSqlParser::ArithmeticBinaryContext* ctx) {
    return ctx->op != nullptr && ctx->op->getType() == HiveSqlParser::PERCENT;
}

RuleOutcome enterModulo(HiveSqlParser::ArithmeticBinaryContext* ctx, TokenView const&, EditLedger& ledger) {
    if (!isModulo(ctx)) return RuleOutcome::noMatch();
    ledger.insertBefore(startIndex(ctx), "mod(");
    ledger.eraseToken(tokenIndex(ctx->op));
    return RuleOutcome::applied();
}

RuleOutcome exitModulo(HiveSqlParser::ArithmeticBinaryContext* ctx, TokenView const&, EditLedger& ledger) {
    if (!isModulo(ctx)) return RuleOutcome::noMatch();
    ledger.insertAfter(stopIndex(ctx->left), ",");
    ledger.insertAfter(stopIndex(ctx), ")");
    return RuleOutcome::applied();
}

}  // namespace

namespace lsst::sqlrw::presto {

void addOperatorRules(rewrite::Stage& stage) {
    stage.onEnter<HiveSqlParser::PredicatedContext>("regexp-operator", enterRegexpMatch);
    stage.onExit<HiveSqlParser::PredicatedContext>("regexp-operator", exitRegexpMatch);
    stage.onEnter<HiveSqlParser::ArithmeticBinaryContext>("modulo", enterModulo);
    stage.onExit<HiveSqlParser::ArithmeticBinaryContext>("modulo", exitModulo);
}

}  // namespace lsst::sqlrw::presto
