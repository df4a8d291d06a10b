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
#include "rewrite/Stage.h"

// Sqlrw headers
#include "parser/ParseException.h"

// LSST headers
#include "lsst/log/Log.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.rewrite.Stage");

}  // namespace

namespace lsst::sqlrw::rewrite {

Stage::Stage(std::string const& name, antlr4::TokenStream* tokens, EditLedger::BlankPredicate const& isBlank)
        : _name(name), _tokens(tokens), _ledger(isBlank) {}

void Stage::enter(antlr4::ParserRuleContext* ctx) { _dispatch(_onEnter, ctx, "enter"); }

void Stage::exit(antlr4::ParserRuleContext* ctx) { _dispatch(_onExit, ctx, "exit"); }

size_t Stage::getRuleCount() const {
    size_t count = 0;
    for (auto const& [type, handlers] : _onEnter) count += handlers.size();
    for (auto const& [type, handlers] : _onExit) count += handlers.size();
    return count;
}

void Stage::_dispatch(HandlerMap const& handlers, antlr4::ParserRuleContext* ctx, char const* phase) {
    auto const itr = handlers.find(std::type_index(typeid(*ctx)));
    if (itr == handlers.end()) return;
    for (auto const& named : itr->second) {
        RuleOutcome const outcome = named.handler(ctx, _tokens, _ledger);
        LOGS(_log, LOG_LVL_TRACE,
             _name << " " << phase << " " << named.ruleName << " at token " << ctx->getStart()->getTokenIndex()
                   << ": " << outcome);
        if (outcome.isApplied()) {
            ++_appliedCount;
        } else if (outcome.isUnsupported()) {
            size_t const start = ctx->getStart()->getTokenIndex();
            size_t const stop = ctx->getStop() == nullptr ? start : ctx->getStop()->getTokenIndex();
            std::string const text = _tokens.getText(start, stop);
            throw parser::UnsupportedConstructError(_name + " stage, rule " + named.ruleName + ": " +
                                                    outcome.getReason() + " in \"" + text + "\"");
        }
    }
}

}  // namespace lsst::sqlrw::rewrite
