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
#ifndef LSST_SQLRW_REWRITE_STAGE_H
#define LSST_SQLRW_REWRITE_STAGE_H

// System headers
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

// Third party headers
#include "antlr4-runtime.h"

// Sqlrw headers
#include "rewrite/EditLedger.h"
#include "rewrite/RuleOutcome.h"
#include "rewrite/TokenView.h"
#include "util/Bug.h"

namespace lsst::sqlrw::rewrite {

/**
 * Stage is one pass of rewriting over a parsed statement: a named set of rules, dispatched
 * by the kind of parse tree node, that record edits into the ledger of the stage.
 *
 * Rules are registered for a concrete parser context class, either on entering or on exiting
 * nodes of that class. When a node is visited the rules registered for its class run in their
 * registration order. Rules recording insert-befores do so on enter, and rules recording
 * insert-afters do so on exit, so nested rewrites wrap each other correctly.
 *
 * A stage is built for one token stream and used for a single walk.
 */
class Stage {
public:
    typedef std::shared_ptr<Stage> Ptr;

    /// A rule as stored by the stage, taking any context.
    typedef std::function<RuleOutcome(antlr4::ParserRuleContext*, TokenView const&, EditLedger&)> Handler;

    /// A rule for a concrete context class.
    template <typename Context>
    using Rule = std::function<RuleOutcome(Context*, TokenView const&, EditLedger&)>;

    Stage(std::string const& name, antlr4::TokenStream* tokens,
          EditLedger::BlankPredicate const& isBlank = &EditLedger::isWhitespace);

    Stage(Stage const&) = delete;
    Stage& operator=(Stage const&) = delete;

    /// Run `rule` when the walk enters a node of class `Context`.
    template <typename Context>
    void onEnter(std::string const& ruleName, Rule<Context> const& rule) {
        _onEnter[std::type_index(typeid(Context))].push_back(NamedHandler{ruleName, _wrap<Context>(rule)});
    }

    /// Run `rule` when the walk exits a node of class `Context`.
    template <typename Context>
    void onExit(std::string const& ruleName, Rule<Context> const& rule) {
        _onExit[std::type_index(typeid(Context))].push_back(NamedHandler{ruleName, _wrap<Context>(rule)});
    }

    /**
     * Dispatch the rules registered for entering the node.
     *
     * @throws parser::UnsupportedConstructError if a rule reports an unsupported construct.
     */
    void enter(antlr4::ParserRuleContext* ctx);

    /// Dispatch the rules registered for exiting the node.
    void exit(antlr4::ParserRuleContext* ctx);

    std::string const& getName() const { return _name; }

    TokenView const& getTokens() const { return _tokens; }

    EditLedger const& getLedger() const { return _ledger; }

    /// @return how many times a rule of this stage reported APPLIED.
    size_t getAppliedCount() const { return _appliedCount; }

    /// @return the number of registered rules.
    size_t getRuleCount() const;

    /// @return the rewritten statement.
    std::string materialize() { return _ledger.materialize(_tokens); }

private:
    struct NamedHandler {
        std::string ruleName;
        Handler handler;
    };
    typedef std::unordered_map<std::type_index, std::vector<NamedHandler>> HandlerMap;

    template <typename Context>
    static Handler _wrap(Rule<Context> const& rule) {
        return [rule](antlr4::ParserRuleContext* ctx, TokenView const& tokens, EditLedger& ledger) {
            auto concrete = dynamic_cast<Context*>(ctx);
            if (concrete == nullptr) {
                throw util::Bug(ERR_LOC, "rule dispatched to a context of an unexpected class");
            }
            return rule(concrete, tokens, ledger);
        };
    }

    void _dispatch(HandlerMap const& handlers, antlr4::ParserRuleContext* ctx, char const* phase);

    std::string const _name;
    TokenView _tokens;
    EditLedger _ledger;
    HandlerMap _onEnter;
    HandlerMap _onExit;
    size_t _appliedCount = 0;
};

/// Builds a fresh stage over the token stream of one statement.
typedef std::function<Stage::Ptr(antlr4::TokenStream*)> StageFactory;

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_STAGE_H
