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
#include "rewrite/TokenView.h"

// System headers
#include <limits>

// Sqlrw headers
#include "util/Bug.h"
#include "util/String.h"

namespace lsst::sqlrw::rewrite {

size_t const TokenView::npos = std::numeric_limits<size_t>::max();

TokenView::TokenView(antlr4::TokenStream* tokens) : _tokens(tokens) {
    if (_tokens == nullptr) {
        throw util::Bug(ERR_LOC, "TokenView requires a token stream");
    }
}

antlr4::Token* TokenView::get(size_t index) const {
    if (index >= size()) {
        throw util::Bug(ERR_LOC, "token index " + std::to_string(index) + " is outside of a stream of " +
                                         std::to_string(size()) + " tokens");
    }
    return _tokens->get(index);
}

std::string TokenView::getText(size_t index) const {
    auto const token = get(index);
    if (token->getType() == antlr4::Token::EOF) return std::string();
    return token->getText();
}

std::string TokenView::getText(size_t start, size_t stop) const {
    std::string text;
    for (size_t i = start; i <= stop && i < size(); ++i) {
        text += getText(i);
    }
    return text;
}

bool TokenView::isTrivia(size_t index) const {
    return getChannel(index) != antlr4::Token::DEFAULT_CHANNEL;
}

size_t TokenView::find(size_t start, std::string const& text) const {
    for (size_t i = start; i < size(); ++i) {
        if (util::String::equalsIgnoreCase(getText(i), text)) return i;
    }
    return npos;
}

}  // namespace lsst::sqlrw::rewrite
