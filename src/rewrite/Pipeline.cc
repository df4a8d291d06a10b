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
#include "rewrite/Pipeline.h"

// System headers
#include <chrono>
#include <exception>

// Sqlrw headers
#include "parser/StatementParser.h"
#include "rewrite/StageWalker.h"
#include "util/Bug.h"

namespace {

uint64_t millisecondsSince(std::chrono::steady_clock::time_point const& start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
            .count();
}

}  // namespace

namespace lsst::sqlrw::rewrite {

nlohmann::json StageReport::toJson() const {
    nlohmann::json result;
    result["name"] = name;
    result["status"] = status == APPLIED ? "APPLIED" : "SKIPPED";
    result["edits"] = edits;
    result["rules_applied"] = rulesApplied;
    result["elapsed_ms"] = elapsedMs;
    if (!error.empty()) result["error"] = error;
    return result;
}

size_t RewriteResult::numSkipped() const {
    size_t num = 0;
    for (auto const& stage : stages) {
        if (stage.status == StageReport::SKIPPED) ++num;
    }
    return num;
}

nlohmann::json RewriteResult::toJson() const {
    nlohmann::json result;
    result["text"] = text;
    result["elapsed_ms"] = elapsedMs;
    result["stages"] = nlohmann::json::array();
    for (auto const& stage : stages) {
        result["stages"].push_back(stage.toJson());
    }
    return result;
}

Pipeline::Pipeline(LOG_LOGGER const& logger) : _log(logger) {}

std::string Pipeline::rewrite(std::string const& sql, std::vector<StageFactory> const& factories) const {
    return run(sql, factories).text;
}

RewriteResult Pipeline::run(std::string const& sql, std::vector<StageFactory> const& factories) const {
    auto const start = std::chrono::steady_clock::now();
    RewriteResult result;
    result.text = sql;
    for (size_t position = 0; position < factories.size(); ++position) {
        std::string output;
        result.stages.push_back(_runStage(result.text, position, factories[position], output));
        result.text = output;
    }
    result.elapsedMs = millisecondsSince(start);
    LOGS(_log, LOG_LVL_DEBUG, "sql rewrite time cost " << result.elapsedMs << " ms");
    return result;
}

StageReport Pipeline::_runStage(std::string const& sql, size_t position, StageFactory const& factory,
                                std::string& output) const {
    auto const start = std::chrono::steady_clock::now();
    StageReport report;
    report.name = "stage[" + std::to_string(position) + "]";
    try {
        parser::StatementParser statementParser(sql);
        Stage::Ptr stage = factory(statementParser.getTokens());
        if (stage == nullptr) {
            throw util::Bug(ERR_LOC, report.name + " factory returned no stage");
        }
        report.name = stage->getName();
        StageWalker(*stage).walk(statementParser.parse());
        report.edits = stage->getLedger().size();
        report.rulesApplied = stage->getAppliedCount();
        output = stage->materialize();
        report.status = StageReport::APPLIED;
    } catch (util::Bug const& ex) {
        LOGS(_log, LOG_LVL_ERROR, report.name << " recorded inconsistent edits: " << ex.what());
        throw;
    } catch (std::exception const& ex) {
        LOGS(_log, LOG_LVL_WARN, report.name << " failed to rewrite sql, passing it through: " << ex.what());
        report.status = StageReport::SKIPPED;
        report.error = ex.what();
        output = sql;
    }
    report.elapsedMs = millisecondsSince(start);
    LOGS(_log, LOG_LVL_DEBUG, report.name << " time cost " << report.elapsedMs << " ms");
    return report;
}

bool Pipeline::isValid(std::string const& sql) { return parser::StatementParser::isValid(sql); }

}  // namespace lsst::sqlrw::rewrite
