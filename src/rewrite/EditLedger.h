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
#ifndef LSST_SQLRW_REWRITE_EDITLEDGER_H
#define LSST_SQLRW_REWRITE_EDITLEDGER_H

// System headers
#include <cstddef>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace lsst::sqlrw::rewrite {

class TokenView;

/**
 * EditLedger collects the textual edits one rewrite stage makes to a token stream
 * and turns them into the rewritten statement.
 *
 * Edits are anchored to token indexes of the original stream and never change the
 * stream itself. Recording is cheap and never fails; every consistency check is
 * deferred to materialize(), which runs once.
 *
 * Composition rules applied by materialize():
 *  - inserts anchored at the same token and side are emitted in the order they were recorded;
 *  - a Replace or Delete range nested inside another one is dropped in favor of the outer range;
 *  - of two edits over the very same range the one recorded last wins;
 *  - two ranges which partially overlap are a defect of the rules and raise util::Bug;
 *  - inserts anchored on tokens of a Delete range are dropped, and inside a Replace range
 *    only the insert-before at its first token and the insert-after at its last token survive.
 */
class EditLedger {
public:
    /// A predicate deciding whether the text of a trivia token counts as blank.
    typedef std::function<bool(std::string const&)> BlankPredicate;

    struct Edit {
        enum Kind { INSERT_BEFORE, INSERT_AFTER, REPLACE, DELETE };

        Kind kind;
        size_t start;  ///< the anchor token of an insert, or the first token of a range
        size_t stop;   ///< the anchor token of an insert, or the last token of a range
        std::string text;
        bool absorbTrailingBlank = false;
        size_t seq = 0;  ///< the order in which the edit was recorded

        bool isRange() const { return kind == REPLACE || kind == DELETE; }
    };

    /// The default blank predicate: non-empty text made of whitespace only.
    static bool isWhitespace(std::string const& text);

    explicit EditLedger(BlankPredicate const& isBlank = &EditLedger::isWhitespace);

    EditLedger(EditLedger const&) = delete;
    EditLedger& operator=(EditLedger const&) = delete;

    /// Emit `text` immediately before the token at `anchor`.
    void insertBefore(size_t anchor, std::string const& text);

    /// Emit `text` immediately after the token at `anchor`.
    void insertAfter(size_t anchor, std::string const& text);

    /// Emit `text` in place of the tokens [start, stop].
    void replace(size_t start, size_t stop, std::string const& text);

    void replace(size_t anchor, std::string const& text) { replace(anchor, anchor, text); }

    /**
     * Emit nothing for the tokens [start, stop].
     *
     * @param absorbTrailingBlank if true, also drop the token right after the range when it is
     *   blank trivia not covered by another range. This keeps removed keywords from leaving a
     *   double blank behind.
     */
    void erase(size_t start, size_t stop, bool absorbTrailingBlank = false);

    /// Erase the single token at `anchor` together with one trailing blank.
    void eraseToken(size_t anchor) { erase(anchor, anchor, true); }

    /// @return true if the text of a trivia token counts as blank for this ledger.
    bool isBlank(std::string const& text) const { return _isBlank(text); }

    /// @return the number of recorded edits.
    size_t size() const { return _count; }

    bool empty() const { return _count == 0; }

    /// @return the edits anchored at the token, in the order they were recorded.
    std::vector<Edit> getEdits(size_t anchor) const;

    /// @return all edits in the order they were recorded.
    std::vector<Edit> getEdits() const;

    bool isMaterialized() const { return _materialized; }

    /**
     * Produce the rewritten text in a single pass over the tokens.
     *
     * Untouched tokens, trivia included, are copied exactly. The EOF token contributes
     * no text of its own.
     *
     * @throws util::Bug if the ledger was already materialized, if an edit is anchored outside
     *   of the stream, or if two ranges partially overlap.
     */
    std::string materialize(TokenView const& tokens);

private:
    void _record(Edit::Kind kind, size_t start, size_t stop, std::string const& text,
                 bool absorbTrailingBlank);

    /// Edits keyed by their first token, each list in recording order.
    std::map<size_t, std::vector<Edit>> _edits;

    BlankPredicate _isBlank;
    size_t _count = 0;
    bool _materialized = false;
};

std::ostream& operator<<(std::ostream& os, EditLedger::Edit const& edit);

std::ostream& operator<<(std::ostream& os, EditLedger const& ledger);

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_EDITLEDGER_H
