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
#include "util/CmdLineParser.h"

// System headers
#include <iostream>
#include <stdexcept>

namespace lsst::sqlrw::util {

CmdLineParser::CmdLineParser(int argc, const char* const* argv, std::string const& usage)
        : _usage(usage +
                 "\nSpecial options:\n"
                 "  --help  - print the help page\n") {
    for (int i = 0; i < argc; ++i) _parseArgument(argv[i]);
}

std::string const& CmdLineParser::parameter(size_t pos) const {
    if (pos >= _parameters.size()) {
        throw std::out_of_range("CmdLineParser::" + std::string(__func__) + ": no positional parameter " +
                                std::to_string(pos));
    }
    return _parameters[pos];
}

std::string CmdLineParser::option(std::string const& name, std::string const& defaultValue) const {
    auto const itr = _options.find(name);
    return itr == _options.end() ? defaultValue : itr->second;
}

void CmdLineParser::_parseArgument(std::string const& arg) {
    if (arg.compare(0, 2, "--") != 0) {
        _parameters.push_back(arg);
        return;
    }
    std::string const nameValue = arg.substr(2);
    if (nameValue.empty()) _fail("illegal command line argument: " + arg);

    auto const equalPos = nameValue.find('=');
    if (equalPos == std::string::npos) {
        if (nameValue == "help") _fail("help mode intercepted");
        _flags.insert(nameValue);
        return;
    }
    std::string const name = nameValue.substr(0, equalPos);
    std::string const value = nameValue.substr(equalPos + 1);
    if (name.empty()) _fail("no name given for option: " + arg);
    if (value.empty()) _fail("no value provided for option: " + name);
    _options[name] = value;
}

void CmdLineParser::_fail(std::string const& msg) const {
    std::cerr << msg << "\n" << _usage << std::endl;
    throw std::invalid_argument("CmdLineParser: " + msg);
}

}  // namespace lsst::sqlrw::util
