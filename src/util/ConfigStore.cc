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
#include "util/ConfigStore.h"

// Sqlrw headers
#include "util/ConfigStoreError.h"
#include "util/IterableFormatter.h"
#include "util/String.h"

// Third-party headers
#include "boost/property_tree/ini_parser.hpp"
#include "boost/property_tree/ptree.hpp"

// LSST headers
#include "lsst/log/Log.h"

namespace {  // File-scope helpers

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.util.ConfigStore");

}  // namespace

namespace lsst::sqlrw::util {

std::map<std::string, std::string> ConfigStore::_readIniFile(std::string const& configFilePath) {
    LOGS(_log, LOG_LVL_DEBUG, "reading configuration file: " << configFilePath);

    boost::property_tree::ptree tree;
    boost::property_tree::ini_parser::read_ini(configFilePath, tree);

    std::map<std::string, std::string> configMap;
    for (auto const& [section, params] : tree) {
        for (auto const& [param, value] : params) {
            configMap[section + "." + param] = value.data();
        }
    }
    return configMap;
}

std::string const* ConfigStore::_find(std::string const& key) const {
    auto const itr = _configMap.find(key);
    if (itr == _configMap.end() or itr->second.empty()) return nullptr;
    return &itr->second;
}

std::string ConfigStore::get(std::string const& key, std::string const& defaultValue) const {
    if (auto const value = _find(key)) return *value;
    LOGS(_log, LOG_LVL_DEBUG, "[" << key << "] not set, using default value: \"" << defaultValue << "\"");
    return defaultValue;
}

bool ConfigStore::getBool(std::string const& key, bool defaultValue) const {
    auto const value = _find(key);
    if (value == nullptr) {
        LOGS(_log, LOG_LVL_DEBUG, "[" << key << "] not set, using default value: " << defaultValue);
        return defaultValue;
    }
    std::string const val = String::toLower(String::trim(*value));
    if (val == "true" or val == "yes" or val == "on" or val == "1") return true;
    if (val == "false" or val == "no" or val == "off" or val == "0") return false;
    LOGS(_log, LOG_LVL_WARN, "[" << key << "] is not a boolean: \"" << *value << "\"");
    throw InvalidBooleanValue(key, *value);
}

std::ostream& operator<<(std::ostream& out, ConfigStore const& config) {
    return out << util::printable(config._configMap);
}

}  // namespace lsst::sqlrw::util
