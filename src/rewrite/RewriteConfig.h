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
#ifndef LSST_SQLRW_REWRITE_REWRITECONFIG_H
#define LSST_SQLRW_REWRITE_REWRITECONFIG_H

// System headers
#include <ostream>
#include <string>
#include <vector>

// Third party headers
#include <nlohmann/json.hpp>

// Sqlrw headers
#include "rewrite/Stage.h"

namespace lsst::sqlrw::util {
class ConfigStore;
}

namespace lsst::sqlrw::rewrite {

class StageRegistry;

/**
 * RewriteConfig holds the settings of a rewrite run, read from the [rewrite] section
 * of the configuration:
 *
 *     [rewrite]
 *     stages = presto     # comma separated stage names, run in this order
 *     report = false      # print the per-stage report along with the result
 */
class RewriteConfig {
public:
    static std::string const DEFAULT_STAGES;

    /// A configuration with the default values.
    RewriteConfig();

    /// @throws RewriteConfigError if the stage list is empty.
    /// @throws util::InvalidBooleanValue if the report flag is not a boolean.
    explicit RewriteConfig(util::ConfigStore const& configStore);

    std::vector<std::string> const& getStages() const { return _stages; }

    /// Override the stages with a comma separated list of names.
    /// @throws RewriteConfigError if the list is empty.
    void setStages(std::string const& stages);

    bool getReport() const { return _report; }

    void setReport(bool report) { _report = report; }

    /// @return the factories of the configured stages in order.
    /// @throws RewriteConfigError if a configured stage is not registered.
    std::vector<StageFactory> makeFactories(StageRegistry const& registry) const;

    nlohmann::json toJson() const;

private:
    static std::vector<std::string> _parseStages(std::string const& stages);

    std::vector<std::string> _stages;
    bool _report = false;
};

std::ostream& operator<<(std::ostream& os, RewriteConfig const& config);

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_REWRITECONFIG_H
