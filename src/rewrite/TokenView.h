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
#ifndef LSST_SQLRW_REWRITE_TOKENVIEW_H
#define LSST_SQLRW_REWRITE_TOKENVIEW_H

// System headers
#include <cstddef>
#include <string>

// Third party headers
#include "antlr4-runtime.h"

namespace lsst::sqlrw::rewrite {

/**
 * TokenView is a read-only view over the complete token stream of one lexed statement.
 *
 * Tokens are addressed by their index in the stream, which is stable for the lifetime of
 * the stream. Trivia (whitespace, comments) lives on a channel other than the default one
 * and is part of the view. The trailing EOF token is part of the view as well; its text
 * is empty.
 */
class TokenView {
public:
    /// Returned by find() when no token matches.
    static size_t const npos;

    explicit TokenView(antlr4::TokenStream* tokens);

    TokenView(TokenView const&) = default;
    TokenView& operator=(TokenView const&) = default;

    /// @return the number of tokens, EOF included.
    size_t size() const { return _tokens->size(); }

    /// @return the token at the index.
    /// @throws util::Bug if the index is outside of the stream.
    antlr4::Token* get(size_t index) const;

    /// @return the exact source text of the token, or the empty string for EOF.
    std::string getText(size_t index) const;

    /// @return the source text of the tokens [start, stop], trivia included.
    std::string getText(size_t start, size_t stop) const;

    size_t getType(size_t index) const { return get(index)->getType(); }

    size_t getChannel(size_t index) const { return get(index)->getChannel(); }

    /// @return true if the token is whitespace or a comment (not on the default channel).
    bool isTrivia(size_t index) const;

    bool isEof(size_t index) const { return getType(index) == antlr4::Token::EOF; }

    /**
     * Find the first token at or after `start` whose text equals `text`, ignoring case.
     *
     * @return the index of the token or TokenView::npos.
     */
    size_t find(size_t start, std::string const& text) const;

private:
    antlr4::TokenStream* _tokens;
};

/// @return the index of the first token of the node.
inline size_t startIndex(antlr4::ParserRuleContext* ctx) { return ctx->getStart()->getTokenIndex(); }

/// @return the index of the last token of the node.
inline size_t stopIndex(antlr4::ParserRuleContext* ctx) { return ctx->getStop()->getTokenIndex(); }

inline size_t tokenIndex(antlr4::Token* token) { return token->getTokenIndex(); }

inline size_t tokenIndex(antlr4::tree::TerminalNode* node) { return node->getSymbol()->getTokenIndex(); }

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_TOKENVIEW_H
