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
#ifndef LSST_SQLRW_REWRITE_STAGEREGISTRY_H
#define LSST_SQLRW_REWRITE_STAGEREGISTRY_H

// System headers
#include <map>
#include <string>
#include <vector>

// Sqlrw headers
#include "rewrite/Stage.h"

namespace lsst::sqlrw::rewrite {

/// StageRegistry maps stage names, as used in configuration, to the factories building the stages.
class StageRegistry {
public:
    StageRegistry() = default;
    StageRegistry(StageRegistry const&) = delete;
    StageRegistry& operator=(StageRegistry const&) = delete;

    /// @throws RewriteConfigError if a stage of this name is already registered.
    void add(std::string const& name, StageFactory const& factory);

    bool has(std::string const& name) const { return _factories.count(name) != 0; }

    /// @throws RewriteConfigError if no stage of this name is registered.
    StageFactory get(std::string const& name) const;

    /// @return the factories of the named stages, in the order of the names.
    /// @throws RewriteConfigError if any name is not registered.
    std::vector<StageFactory> get(std::vector<std::string> const& names) const;

    /// @return the registered names, sorted.
    std::vector<std::string> getNames() const;

private:
    std::map<std::string, StageFactory> _factories;
};

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_STAGEREGISTRY_H
