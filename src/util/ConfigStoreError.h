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
 * @brief Errors of reading configuration values.
 */

#ifndef LSST_SQLRW_UTIL_CONFIGSTOREERROR_H
#define LSST_SQLRW_UTIL_CONFIGSTOREERROR_H

// System headers
#include <stdexcept>
#include <string>

namespace lsst::sqlrw::util {

/**
 * Base class of the ConfigStore errors.
 */
class ConfigStoreError : public std::runtime_error {
public:
    explicit ConfigStoreError(std::string const& msg) : std::runtime_error(msg) {}
};

/**
 * The value of a key can not be read as a boolean.
 */
class InvalidBooleanValue : public ConfigStoreError {
public:
    explicit InvalidBooleanValue(std::string const& key, std::string const& value)
            : ConfigStoreError("Configuration key [" + key + "] has invalid boolean value: '" + value + "'") {}
};

}  // namespace lsst::sqlrw::util

#endif  // LSST_SQLRW_UTIL_CONFIGSTOREERROR_H
