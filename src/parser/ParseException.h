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
#ifndef LSST_SQLRW_PARSER_PARSEEXCEPTION_H
#define LSST_SQLRW_PARSER_PARSEEXCEPTION_H

// System headers
#include <stdexcept>
#include <string>

namespace lsst::sqlrw::parser {

/// ParseException is a trivial exception for problems found while lexing or
/// parsing a statement; the statement is not valid for the source dialect.
class ParseException : public std::runtime_error {
public:
    ~ParseException() override = default;

    explicit ParseException(std::string const& msg);
};

// Raised while a rewrite stage walks a parsed statement and one of its rules finds a construct it
// can not translate (for example a LATERAL VIEW over a table function other than explode). The
// statement is valid, but the stage must not produce output for it.
class UnsupportedConstructError : public ParseException {
public:
    using ParseException::ParseException;
};

}  // namespace lsst::sqlrw::parser

#endif  // LSST_SQLRW_PARSER_PARSEEXCEPTION_H
