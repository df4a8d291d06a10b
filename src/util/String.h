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
#ifndef LSST_SQLRW_UTIL_STRING_H
#define LSST_SQLRW_UTIL_STRING_H

// System headers
#include <sstream>
#include <string>
#include <vector>

namespace lsst::sqlrw::util {

/// Functions to help with string processing.
class String {
public:
    /**
     * Split the input string into substrings using the specified delimiter.
     * @param str The input string to be parsed.
     * @param delimiter A delimiter.
     * @param skipEmpty The optional flag that if 'true' would eliminate empty strings from
     *   the result. Otherwise the empty strings found between the delimiter will
     *   be preserved in the result.
     * @return A collection of strings resulting from splitting the input string into
     *   sub-strings using the delimiter. The delimiter won't be included into the substrings.
     */
    static std::vector<std::string> split(std::string const& str, std::string const& delimiter,
                                          bool skipEmpty = false);

    /**
     * Pack a collection into a string, using an (optional) delimiter and
     * (optional) brackets around each element.
     * @param coll The input collection.
     * @param delimiter An (optional) delimiter between elements.
     * @param openingBracket An (optional) opening bracket.
     * @param closingBracket An (optional) closing bracket.
     * @return The string representation of the collection.
     */
    template <typename COLLECTION>
    static std::string toString(COLLECTION const& coll, std::string const& delimiter = ",",
                                std::string const& openingBracket = "",
                                std::string const& closingBracket = "") {
        std::ostringstream ss;
        for (auto itr = coll.begin(); itr != coll.end(); ++itr) {
            if (coll.begin() != itr) ss << delimiter;
            ss << openingBracket << *itr << closingBracket;
        }
        return ss.str();
    }

    /// @return The string with leading and trailing whitespace removed.
    static std::string trim(std::string const& str);

    /// @return The string without the line breaks at its end.
    static std::string trimLineBreaks(std::string const& str);

    /// @param str A string to be translated
    /// @return The string with all characters converted to lower case.
    static std::string toLower(std::string const& str);


    /// @return true if both strings are equal after ASCII case folding.
    static bool equalsIgnoreCase(std::string const& lhs, std::string const& rhs);
};

}  // namespace lsst::sqlrw::util

#endif  // LSST_SQLRW_UTIL_STRING_H
