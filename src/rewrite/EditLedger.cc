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
#include "rewrite/EditLedger.h"

// System headers
#include <algorithm>
#include <cctype>
#include <sstream>

// Sqlrw headers
#include "rewrite/TokenView.h"
#include "util/Bug.h"

// LSST headers
#include "lsst/log/Log.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.rewrite.EditLedger");

char const* kindName(lsst::sqlrw::rewrite::EditLedger::Edit::Kind kind) {
    using Edit = lsst::sqlrw::rewrite::EditLedger::Edit;
    switch (kind) {
        case Edit::INSERT_BEFORE:
            return "INSERT_BEFORE";
        case Edit::INSERT_AFTER:
            return "INSERT_AFTER";
        case Edit::REPLACE:
            return "REPLACE";
        case Edit::DELETE:
            return "DELETE";
    }
    return "UNKNOWN";
}

}  // namespace

namespace lsst::sqlrw::rewrite {

bool EditLedger::isWhitespace(std::string const& text) {
    if (text.empty()) return false;
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

EditLedger::EditLedger(BlankPredicate const& isBlank) : _isBlank(isBlank) {
    if (!_isBlank) _isBlank = &EditLedger::isWhitespace;
}

void EditLedger::insertBefore(size_t anchor, std::string const& text) {
    _record(Edit::INSERT_BEFORE, anchor, anchor, text, false);
}

void EditLedger::insertAfter(size_t anchor, std::string const& text) {
    _record(Edit::INSERT_AFTER, anchor, anchor, text, false);
}

void EditLedger::replace(size_t start, size_t stop, std::string const& text) {
    _record(Edit::REPLACE, start, stop, text, false);
}

void EditLedger::erase(size_t start, size_t stop, bool absorbTrailingBlank) {
    _record(Edit::DELETE, start, stop, std::string(), absorbTrailingBlank);
}

void EditLedger::_record(Edit::Kind kind, size_t start, size_t stop, std::string const& text,
                         bool absorbTrailingBlank) {
    Edit edit;
    edit.kind = kind;
    edit.start = start;
    edit.stop = stop;
    edit.text = text;
    edit.absorbTrailingBlank = absorbTrailingBlank;
    edit.seq = _count++;
    LOGS(_log, LOG_LVL_TRACE, "record " << edit);
    _edits[start].push_back(std::move(edit));
}

std::vector<EditLedger::Edit> EditLedger::getEdits(size_t anchor) const {
    auto const itr = _edits.find(anchor);
    if (itr == _edits.end()) return std::vector<Edit>();
    return itr->second;
}

std::vector<EditLedger::Edit> EditLedger::getEdits() const {
    std::vector<Edit> edits;
    for (auto const& [anchor, list] : _edits) {
        edits.insert(edits.end(), list.begin(), list.end());
    }
    std::sort(edits.begin(), edits.end(), [](Edit const& a, Edit const& b) { return a.seq < b.seq; });
    return edits;
}

std::string EditLedger::materialize(TokenView const& tokens) {
    if (_materialized) {
        throw util::Bug(ERR_LOC, "the edit ledger has already been materialized");
    }
    _materialized = true;

    size_t const numTokens = tokens.size();

    // Validate anchors and collect the ranges.
    std::vector<Edit const*> ranges;
    for (auto const& [anchor, list] : _edits) {
        for (auto const& edit : list) {
            if (edit.start > edit.stop || edit.stop >= numTokens) {
                std::ostringstream os;
                os << "edit " << edit << " is anchored outside of a stream of " << numTokens << " tokens";
                throw util::Bug(ERR_LOC, os.str());
            }
            if (edit.isRange()) ranges.push_back(&edit);
        }
    }
    std::sort(ranges.begin(), ranges.end(), [](Edit const* a, Edit const* b) {
        if (a->start != b->start) return a->start < b->start;
        if (a->stop != b->stop) return a->stop > b->stop;
        return a->seq < b->seq;
    });

    // Resolve the ranges into a set of disjoint outermost ones. The chain of
    // ranges enclosing the current position is kept in 'open'.
    std::vector<Edit const*> accepted;
    std::vector<Edit const*> open;
    for (auto range : ranges) {
        while (!open.empty() && open.back()->stop < range->start) open.pop_back();
        if (open.empty()) {
            open.push_back(range);
            accepted.push_back(range);
            continue;
        }
        Edit const* enclosing = open.back();
        if (range->stop > enclosing->stop) {
            std::ostringstream os;
            os << "edits " << *enclosing << " and " << *range << " partially overlap";
            throw util::Bug(ERR_LOC, os.str());
        }
        if (range->start == enclosing->start && range->stop == enclosing->stop) {
            LOGS(_log, LOG_LVL_TRACE, "edit " << *range << " supersedes " << *enclosing);
            if (open.size() == 1) accepted.back() = range;
            open.back() = range;
            continue;
        }
        LOGS(_log, LOG_LVL_TRACE, "edit " << *range << " is nested in " << *enclosing << ", dropped");
        open.push_back(range);
    }

    std::vector<Edit const*> cover(numTokens, nullptr);
    for (auto range : accepted) {
        for (size_t i = range->start; i <= range->stop; ++i) cover[i] = range;
    }
    std::vector<bool> absorbed(numTokens, false);
    for (auto range : accepted) {
        if (!range->absorbTrailingBlank) continue;
        size_t const next = range->stop + 1;
        if (next < numTokens && cover[next] == nullptr && !tokens.isEof(next) && tokens.isTrivia(next) &&
            _isBlank(tokens.getText(next))) {
            absorbed[next] = true;
        }
    }

    std::string result;
    for (size_t i = 0; i < numTokens; ++i) {
        Edit const* range = cover[i];
        bool const keepBefore = range == nullptr || (range->kind == Edit::REPLACE && i == range->start);
        bool const keepAfter = range == nullptr || (range->kind == Edit::REPLACE && i == range->stop);
        auto const itr = _edits.find(i);
        if (keepBefore && itr != _edits.end()) {
            for (auto const& edit : itr->second) {
                if (edit.kind == Edit::INSERT_BEFORE) result += edit.text;
            }
        }
        if (range == nullptr) {
            if (!absorbed[i]) result += tokens.getText(i);
        } else if (i == range->start) {
            result += range->text;
        }
        if (keepAfter && itr != _edits.end()) {
            for (auto const& edit : itr->second) {
                if (edit.kind == Edit::INSERT_AFTER) result += edit.text;
            }
        }
    }
    LOGS(_log, LOG_LVL_TRACE, "materialized " << _count << " edits: " << result);
    return result;
}

std::ostream& operator<<(std::ostream& os, EditLedger::Edit const& edit) {
    os << kindName(edit.kind) << "#" << edit.seq << "[" << edit.start;
    if (edit.isRange()) os << ".." << edit.stop;
    os << "]";
    if (edit.kind != EditLedger::Edit::DELETE) os << " \"" << edit.text << "\"";
    if (edit.absorbTrailingBlank) os << " +blank";
    return os;
}

std::ostream& operator<<(std::ostream& os, EditLedger const& ledger) {
    os << "EditLedger(";
    bool first = true;
    for (auto const& edit : ledger.getEdits()) {
        if (!first) os << ", ";
        first = false;
        os << edit;
    }
    os << ")";
    return os;
}

}  // namespace lsst::sqlrw::rewrite
