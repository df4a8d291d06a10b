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
#ifndef LSST_SQLRW_REWRITE_RULEOUTCOME_H
#define LSST_SQLRW_REWRITE_RULEOUTCOME_H

// System headers
#include <ostream>
#include <string>

namespace lsst::sqlrw::rewrite {

/// The result of invoking one rewrite rule on one parse tree node.
class RuleOutcome {
public:
    enum Status {
        NO_MATCH,    ///< the node is not something the rule rewrites
        APPLIED,     ///< the rule recorded its edits
        UNSUPPORTED  ///< the rule matched but can not translate the construct
    };

    static RuleOutcome noMatch() { return RuleOutcome(NO_MATCH); }
    static RuleOutcome applied() { return RuleOutcome(APPLIED); }
    static RuleOutcome unsupported(std::string const& reason) { return RuleOutcome(UNSUPPORTED, reason); }

    Status getStatus() const { return _status; }
    bool isApplied() const { return _status == APPLIED; }
    bool isUnsupported() const { return _status == UNSUPPORTED; }

    /// @return the reason given by an unsupported outcome.
    std::string const& getReason() const { return _reason; }

private:
    explicit RuleOutcome(Status status, std::string const& reason = std::string())
            : _status(status), _reason(reason) {}

    Status _status;
    std::string _reason;
};

inline std::ostream& operator<<(std::ostream& os, RuleOutcome const& outcome) {
    switch (outcome.getStatus()) {
        case RuleOutcome::NO_MATCH:
            return os << "NO_MATCH";
        case RuleOutcome::APPLIED:
            return os << "APPLIED";
        case RuleOutcome::UNSUPPORTED:
            return os << "UNSUPPORTED(" << outcome.getReason() << ")";
    }
    return os;
}

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_RULEOUTCOME_H
