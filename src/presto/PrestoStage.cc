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
#include "presto/PrestoStage.h"

// Sqlrw headers
#include "presto/ClauseRules.h"
#include "presto/IdentifierRules.h"
#include "presto/LiteralRules.h"
#include "presto/OperatorRules.h"
#include "rewrite/StageRegistry.h"

// LSST headers
#include "lsst/log/Log.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.presto.PrestoStage");

}  // namespace

namespace lsst::sqlrw::presto {

std::string const PRESTO_STAGE_NAME = "presto";

rewrite::Stage::Ptr makePrestoStage(antlr4::TokenStream* tokens) {
    auto stage = std::make_shared<rewrite::Stage>(PRESTO_STAGE_NAME, tokens);
    addOperatorRules(*stage);
    addLiteralRules(*stage);
    addIdentifierRules(*stage);
    addClauseRules(*stage);
    LOGS(_log, LOG_LVL_TRACE, "built stage " << stage->getName() << " with " << stage->getRuleCount() << " rules");
    return stage;
}

void registerStages(rewrite::StageRegistry& registry) { registry.add(PRESTO_STAGE_NAME, makePrestoStage); }

}  // namespace lsst::sqlrw::presto
