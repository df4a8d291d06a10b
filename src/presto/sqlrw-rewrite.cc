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

// System headers
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

// Sqlrw headers
#include "presto/PrestoStage.h"
#include "rewrite/Pipeline.h"
#include "rewrite/RewriteConfig.h"
#include "rewrite/StageRegistry.h"
#include "util/CmdLineParser.h"
#include "util/ConfigStore.h"
#include "util/String.h"

namespace rewrite = lsst::sqlrw::rewrite;
namespace util = lsst::sqlrw::util;

using namespace std;

namespace {

// Command line parameters

string sql;
string configFile;
string stages;
bool validate;
bool report;

string readStdin() {
    return util::String::trimLineBreaks(string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>()));
}

int run() {
    rewrite::RewriteConfig config;
    if (!::configFile.empty()) config = rewrite::RewriteConfig(util::ConfigStore(::configFile));
    if (!::stages.empty()) config.setStages(::stages);
    if (::report) config.setReport(true);

    if (::sql.empty()) ::sql = readStdin();

    if (::validate) {
        bool const valid = rewrite::Pipeline::isValid(::sql);
        cout << (valid ? "valid" : "invalid") << endl;
        return valid ? 0 : 2;
    }

    rewrite::StageRegistry registry;
    lsst::sqlrw::presto::registerStages(registry);

    rewrite::Pipeline const pipeline;
    auto const result = pipeline.run(::sql, config.makeFactories(registry));
    if (config.getReport()) {
        cout << result.toJson().dump(2) << endl;
    } else {
        cout << result.text << endl;
    }
    return 0;
}

}  // namespace

int main(int argc, const char* const argv[]) {
    // Parse command line parameters
    try {
        util::CmdLineParser parser(
                argc, argv,
                "\n"
                "Usage:\n"
                "  [<sql>]\n"
                "  [--config=<file>]\n"
                "  [--stages=<name>[,<name>...]]\n"
                "  [--validate]\n"
                "  [--report]\n"
                "\n"
                "Rewrite a Hive SQL statement read from <sql>, or from the standard input\n"
                "when <sql> is not given, and print the result.\n"
                "\n"
                "Flags and options:\n"
                "  --config=<file>  - INI configuration file with the [rewrite] section\n"
                "  --stages=<list>  - comma separated stages to run, overrides rewrite.stages\n"
                "  --validate       - only check whether the statement parses\n"
                "  --report         - print the JSON report of the stages instead of the text\n");

        if (parser.numParameters() > 1) ::sql = parser.parameter(1);
        ::configFile = parser.option("config", "");
        ::stages = parser.option("stages", "");
        ::validate = parser.flag("validate");
        ::report = parser.flag("report");

    } catch (exception const& ex) {
        return 1;
    }
    try {
        return ::run();
    } catch (exception const& ex) {
        cerr << ex.what() << endl;
        return 1;
    }
}
