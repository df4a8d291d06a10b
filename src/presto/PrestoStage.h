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
#ifndef LSST_SQLRW_PRESTO_PRESTOSTAGE_H
#define LSST_SQLRW_PRESTO_PRESTOSTAGE_H

// System headers
#include <string>

// Third party headers
#include "antlr4-runtime.h"

// Sqlrw headers
#include "rewrite/Stage.h"

namespace lsst::sqlrw::rewrite {
class StageRegistry;
}

namespace lsst::sqlrw::presto {

/// The name of the Hive to Presto stage in configuration and reports.
extern std::string const PRESTO_STAGE_NAME;

/**
 * Build the stage translating Hive SQL to Presto SQL over the token stream.
 *
 * The stage carries the operator, identifier, literal and clause rules. A LATERAL VIEW
 * over anything but explode, or a LATERAL VIEW OUTER, aborts the stage.
 */
rewrite::Stage::Ptr makePrestoStage(antlr4::TokenStream* tokens);

/// Register every stage of this module with the registry.
void registerStages(rewrite::StageRegistry& registry);

}  // namespace lsst::sqlrw::presto

#endif  // LSST_SQLRW_PRESTO_PRESTOSTAGE_H
