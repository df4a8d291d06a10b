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
#include "util/String.h"

// System headers
#include <algorithm>
#include <cctype>

using namespace std;

namespace lsst::sqlrw::util {

vector<string> String::split(string const& original, string const& delimiter, bool skipEmpty) {
    // Apply trivial optimizations. Note that the specified "skipEmpty" behavior
    // must be preserved during the optimisations.
    vector<string> result;
    if (original.empty()) {
        if (!skipEmpty) result.push_back(original);
        return result;
    }
    if (delimiter.empty()) {
        result.push_back(original);
        return result;
    }
    string str(original);
    size_t pos;
    bool loop = true;
    while (loop) {
        pos = str.find(delimiter);
        if (pos == string::npos) {
            loop = false;
        }
        auto const candidate = str.substr(0, pos);
        if (!candidate.empty() || !skipEmpty) result.push_back(candidate);
        if (loop) str = str.substr(pos + delimiter.length());
    }
    return result;
}

string String::trim(string const& str) {
    auto const isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto const first = find_if_not(str.begin(), str.end(), isSpace);
    auto const last = find_if_not(str.rbegin(), str.rend(), isSpace).base();
    return first < last ? string(first, last) : string();
}

string String::trimLineBreaks(string const& str) {
    auto const last = str.find_last_not_of("\r\n");
    return last == string::npos ? string() : str.substr(0, last + 1);
}

string String::toLower(string const& str) {
    string result = str;
    transform(result.begin(), result.end(), result.begin(),
              [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool String::equalsIgnoreCase(string const& lhs, string const& rhs) {
    return equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char l, unsigned char r) {
        return std::tolower(l) == std::tolower(r);
    });
}

}  // namespace lsst::sqlrw::util
