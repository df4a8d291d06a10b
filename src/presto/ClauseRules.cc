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
#include "presto/ClauseRules.h"

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

// LATERAL VIEW explode(b) t2 AS c -> cross join unnest(b) as t2 (c)
RuleOutcome enterLateralView(HiveSqlParser::LateralViewContext* ctx, TokenView const& tokens,
                             EditLedger& ledger) {
    auto const udtf = ctx->qualifiedName();
    std::string const udtfName = tokens.getText(startIndex(udtf), stopIndex(udtf));
    if (!util::String::equalsIgnoreCase(udtfName, "explode")) {
        return RuleOutcome::unsupported("table generating function " + udtfName + " has no unnest form");
    }
    if (ctx->OUTER() != nullptr) {
        return RuleOutcome::unsupported("LATERAL VIEW OUTER has no cross join form");
    }
    ledger.replace(startIndex(ctx), stopIndex(udtf), "cross join unnest");
    ledger.insertBefore(startIndex(ctx->tblName), "as ");
    if (ctx->AS() != nullptr) ledger.eraseToken(tokenIndex(ctx->AS()));
    if (!ctx->colName.empty()) {
        ledger.insertBefore(startIndex(ctx->colName.front()), "(");
        ledger.insertAfter(stopIndex(ctx->colName.back()), ")");
    }
    return RuleOutcome::applied();
}

/// Erase the clause [start, stop] and the blank right before it.
void eraseClause(size_t start, size_t stop, TokenView const& tokens, EditLedger& ledger) {
    if (start > 0 && tokens.isTrivia(start - 1) && ledger.isBlank(tokens.getText(start - 1))) --start;
    ledger.erase(start, stop);
}

RuleOutcome exitQueryOrganization(HiveSqlParser::QueryOrganizationContext* ctx, TokenView const& tokens,
                                  EditLedger& ledger) {
    bool applied = false;
    if (ctx->CLUSTER() != nullptr) {
        eraseClause(tokenIndex(ctx->CLUSTER()), stopIndex(ctx->clusterBy.back()), tokens, ledger);
        applied = true;
    }
    if (ctx->DISTRIBUTE() != nullptr) {
        eraseClause(tokenIndex(ctx->DISTRIBUTE()), stopIndex(ctx->distributeBy.back()), tokens, ledger);
        applied = true;
    }
    if (ctx->SORT() != nullptr) {
        ledger.replace(tokenIndex(ctx->SORT()), "order");
        applied = true;
    }
    return applied ? RuleOutcome::applied() : RuleOutcome::noMatch();
}

}  // namespace

namespace lsst::sqlrw::presto {

void addClauseRules(rewrite::Stage& stage) {
    stage.onEnter<HiveSqlParser::LateralViewContext>("lateral-view", enterLateralView);
    stage.onExit<HiveSqlParser::QueryOrganizationContext>("query-organization", exitQueryOrganization);
}

}  // namespace lsst::sqlrw::presto
