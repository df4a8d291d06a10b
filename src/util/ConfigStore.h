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
/**
 * @file
 *
 * @ingroup util
 *
 * @brief Read the INI configuration files of the sqlrw tools.
 */

#ifndef LSST_SQLRW_UTIL_CONFIGSTORE_H
#define LSST_SQLRW_UTIL_CONFIGSTORE_H

// System headers
#include <map>
#include <ostream>
#include <string>

namespace lsst::sqlrw::util {

/**
 * @brief Flattened view of an INI configuration.
 *
 * Every parameter is stored under the key "<section>.<parameter>". Missing keys
 * and empty values fall back to the defaults given by the callers.
 */
class ConfigStore {
public:
    /**
     * @param configFilePath: path to the INI configuration file
     * @throw boost::property_tree::ini_parser_error if the file can not be read or parsed
     */
    explicit ConfigStore(std::string const& configFilePath) : _configMap(_readIniFile(configFilePath)) {}

    /// @param configMap: configuration keyed by "<section>.<parameter>"
    explicit ConfigStore(std::map<std::string, std::string> const& configMap) : _configMap(configMap) {}

    ConfigStore() = default;
    ConfigStore(ConfigStore const&) = default;
    ConfigStore& operator=(ConfigStore const&) = default;

    friend std::ostream& operator<<(std::ostream& out, ConfigStore const& config);

    /// @return the value of the key, or `defaultValue` if the key is not found
    std::string get(std::string const& key, std::string const& defaultValue = std::string()) const;

    /**
     * Get the boolean value for a configuration key or a default value if key is not found.
     * Accepted spellings are true/false, yes/no, on/off and 1/0 (case insensitive).
     *
     * @throw InvalidBooleanValue if value can not be converted to a boolean
     */
    bool getBool(std::string const& key, bool defaultValue = false) const;

private:
    static std::map<std::string, std::string> _readIniFile(std::string const& configFilePath);

    /// @return the value of the key, nullptr if the key is missing or its value is empty
    std::string const* _find(std::string const& key) const;

    std::map<std::string, std::string> _configMap;
};

}  // namespace lsst::sqlrw::util

#endif  // LSST_SQLRW_UTIL_CONFIGSTORE_H
