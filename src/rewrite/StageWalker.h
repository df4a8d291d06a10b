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
#ifndef LSST_SQLRW_REWRITE_STAGEWALKER_H
#define LSST_SQLRW_REWRITE_STAGEWALKER_H

// Third party headers
#include "antlr4-runtime.h"

namespace lsst::sqlrw::rewrite {

class Stage;

/// StageWalker walks a parse tree depth first and hands every rule node to a Stage
/// for dispatch, pre-order on enter and post-order on exit.
class StageWalker : public antlr4::tree::ParseTreeListener {
public:
    explicit StageWalker(Stage& stage) : _stage(stage) {}

    /// Walk the whole tree below and including `tree`.
    void walk(antlr4::tree::ParseTree* tree);

    void visitTerminal(antlr4::tree::TerminalNode*) override {}
    void visitErrorNode(antlr4::tree::ErrorNode*) override {}
    void enterEveryRule(antlr4::ParserRuleContext* ctx) override;
    void exitEveryRule(antlr4::ParserRuleContext* ctx) override;

private:
    Stage& _stage;
};

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_STAGEWALKER_H
