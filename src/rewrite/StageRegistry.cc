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
#include "rewrite/StageRegistry.h"

// Sqlrw headers
#include "rewrite/RewriteConfigError.h"
#include "util/String.h"

namespace lsst::sqlrw::rewrite {

void StageRegistry::add(std::string const& name, StageFactory const& factory) {
    if (name.empty() || factory == nullptr) {
        throw RewriteConfigError(ERR_LOC, "a stage needs a name and a factory");
    }
    if (!_factories.emplace(name, factory).second) {
        throw RewriteConfigError(ERR_LOC, "stage '" + name + "' is already registered");
    }
}

StageFactory StageRegistry::get(std::string const& name) const {
    auto const itr = _factories.find(name);
    if (itr == _factories.end()) {
        throw RewriteConfigError(ERR_LOC, "unknown stage '" + name + "', known stages: " +
                                                  util::String::toString(getNames(), ", "));
    }
    return itr->second;
}

std::vector<StageFactory> StageRegistry::get(std::vector<std::string> const& names) const {
    std::vector<StageFactory> factories;
    for (auto const& name : names) {
        factories.push_back(get(name));
    }
    return factories;
}

std::vector<std::string> StageRegistry::getNames() const {
    std::vector<std::string> names;
    for (auto const& [name, factory] : _factories) names.push_back(name);
    return names;
}

}  // namespace lsst::sqlrw::rewrite
