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
#include "rewrite/RewriteConfig.h"

// Sqlrw headers
#include "rewrite/RewriteConfigError.h"
#include "rewrite/StageRegistry.h"
#include "util/ConfigStore.h"
#include "util/String.h"

// LSST headers
#include "lsst/log/Log.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.rewrite.RewriteConfig");

}  // namespace

namespace lsst::sqlrw::rewrite {

std::string const RewriteConfig::DEFAULT_STAGES = "presto";

RewriteConfig::RewriteConfig() : _stages(_parseStages(DEFAULT_STAGES)) {}

RewriteConfig::RewriteConfig(util::ConfigStore const& configStore)
        : _stages(_parseStages(configStore.get("rewrite.stages", DEFAULT_STAGES))),
          _report(configStore.getBool("rewrite.report", false)) {
    LOGS(_log, LOG_LVL_DEBUG, "rewrite configuration: " << *this << " from " << configStore);
}

void RewriteConfig::setStages(std::string const& stages) { _stages = _parseStages(stages); }

std::vector<StageFactory> RewriteConfig::makeFactories(StageRegistry const& registry) const {
    return registry.get(_stages);
}

nlohmann::json RewriteConfig::toJson() const {
    nlohmann::json result;
    result["stages"] = _stages;
    result["report"] = _report;
    return result;
}

std::vector<std::string> RewriteConfig::_parseStages(std::string const& stages) {
    std::vector<std::string> names;
    for (auto const& name : util::String::split(stages, ",", true)) {
        std::string const trimmed = util::String::trim(name);
        if (!trimmed.empty()) names.push_back(trimmed);
    }
    if (names.empty()) {
        throw RewriteConfigError(ERR_LOC, "no rewrite stages in '" + stages + "'");
    }
    return names;
}

std::ostream& operator<<(std::ostream& os, RewriteConfig const& config) {
    os << config.toJson().dump();
    return os;
}

}  // namespace lsst::sqlrw::rewrite
