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
#ifndef LSST_SQLRW_UTIL_CMDLINEPARSER_H
#define LSST_SQLRW_UTIL_CMDLINEPARSER_H

// System headers
#include <map>
#include <set>
#include <string>
#include <vector>

namespace lsst::sqlrw::util {

/**
 * Class CmdLineParser splits the command line of the sqlrw tools into positional
 * parameters, flags (--name) and options (--name=value).
 *
 * Parameter 0 is the name of the program. The flag "--help" prints the usage text
 * and aborts the parse.
 */
class CmdLineParser {
public:
    /**
     * @param argc  number of arguments
     * @param argv  the arguments
     * @param usage the usage text printed on errors and for --help
     * @throw std::invalid_argument for malformed arguments or in the help mode
     */
    CmdLineParser(int argc, const char* const* argv, std::string const& usage);

    CmdLineParser() = delete;
    CmdLineParser(CmdLineParser const&) = delete;
    CmdLineParser& operator=(CmdLineParser const&) = delete;

    /// @return the number of positional parameters, the program name included
    size_t numParameters() const { return _parameters.size(); }

    /// @throw std::out_of_range if there are too few parameters
    std::string const& parameter(size_t pos) const;

    /// @return the value of the option, or `defaultValue` if it was not given
    std::string option(std::string const& name, std::string const& defaultValue) const;

    bool flag(std::string const& name) const { return _flags.count(name) != 0; }

    std::string const& usage() const { return _usage; }

private:
    void _parseArgument(std::string const& arg);

    /// Print the message along with the usage text and throw std::invalid_argument.
    [[noreturn]] void _fail(std::string const& msg) const;

    std::string const _usage;

    std::vector<std::string> _parameters;
    std::map<std::string, std::string> _options;
    std::set<std::string> _flags;
};

}  // namespace lsst::sqlrw::util

#endif  // LSST_SQLRW_UTIL_CMDLINEPARSER_H
