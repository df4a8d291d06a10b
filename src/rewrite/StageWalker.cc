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
#include "rewrite/StageWalker.h"

// Sqlrw headers
#include "rewrite/Stage.h"

namespace lsst::sqlrw::rewrite {

void StageWalker::walk(antlr4::tree::ParseTree* tree) { antlr4::tree::ParseTreeWalker::DEFAULT.walk(this, tree); }

void StageWalker::enterEveryRule(antlr4::ParserRuleContext* ctx) { _stage.enter(ctx); }

void StageWalker::exitEveryRule(antlr4::ParserRuleContext* ctx) { _stage.exit(ctx); }

}  // namespace lsst::sqlrw::rewrite
