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
#ifndef LSST_SQLRW_REWRITE_PIPELINE_H
#define LSST_SQLRW_REWRITE_PIPELINE_H

// System headers
#include <cstdint>
#include <string>
#include <vector>

// Third party headers
#include <nlohmann/json.hpp>

// Sqlrw headers
#include "rewrite/Stage.h"

// LSST headers
#include "lsst/log/Log.h"

namespace lsst::sqlrw::rewrite {

/// What happened to the statement in one stage of a pipeline run.
struct StageReport {
    enum Status {
        APPLIED,  ///< the stage produced the input of the next stage
        SKIPPED   ///< the stage failed and its input was passed through
    };

    std::string name;
    Status status = SKIPPED;
    size_t edits = 0;        ///< edits recorded in the ledger
    size_t rulesApplied = 0;  ///< rule invocations which reported APPLIED
    uint64_t elapsedMs = 0;
    std::string error;  ///< the failure of a skipped stage

    nlohmann::json toJson() const;
};

/// The final statement and the per-stage history of a pipeline run.
struct RewriteResult {
    std::string text;
    std::vector<StageReport> stages;
    uint64_t elapsedMs = 0;

    /// @return the number of stages which were skipped.
    size_t numSkipped() const;

    nlohmann::json toJson() const;
};

/**
 * Pipeline runs an ordered list of rewrite stages over a statement.
 *
 * Each stage re-lexes and re-parses the output of the stage before it, walks the
 * fresh tree with its rules and materializes its ledger. A stage which fails to lex,
 * to parse, or to translate a construct is logged and skipped: its input is handed
 * unchanged to the next stage. Defects of the rules themselves (util::Bug) are not
 * skipped and propagate to the caller.
 */
class Pipeline {
public:
    explicit Pipeline(LOG_LOGGER const& logger = LOG_GET("lsst.sqlrw.rewrite.Pipeline"));

    /**
     * Rewrite the statement with the stages built by `factories`, in order.
     *
     * @return the rewritten statement, or `sql` itself if no stage succeeded.
     * @throws util::Bug if a stage records inconsistent edits.
     */
    std::string rewrite(std::string const& sql, std::vector<StageFactory> const& factories) const;

    /// Same as rewrite() but also reports what happened in every stage.
    RewriteResult run(std::string const& sql, std::vector<StageFactory> const& factories) const;

    /// @return true if `sql` lexes and parses as Hive SQL.
    static bool isValid(std::string const& sql);

private:
    /// Run one stage. On success `output` receives the rewritten text, otherwise `sql`.
    StageReport _runStage(std::string const& sql, size_t position, StageFactory const& factory,
                          std::string& output) const;

    LOG_LOGGER _log;
};

}  // namespace lsst::sqlrw::rewrite

#endif  // LSST_SQLRW_REWRITE_PIPELINE_H
