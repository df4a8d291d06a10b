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
#include "parser/StatementParser.h"

// Sqlrw headers
#include "parser/ParseException.h"
#include "util/IterableFormatter.h"

// LSST headers
#include "lsst/log/Log.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.sqlrw.parser.StatementParser");

std::string failureMessage(std::string const& statement) {
    return "Failed to parse statement: \"" + statement + "\"";
}

/// Error strategy that gives up on the first syntax error instead of resynchronizing.
class Antlr4ErrorStrategy : public antlr4::DefaultErrorStrategy {
public:
    explicit Antlr4ErrorStrategy(std::string const& statement) : _statement(statement) {}
    Antlr4ErrorStrategy() = delete;
    Antlr4ErrorStrategy(Antlr4ErrorStrategy const&) = delete;
    Antlr4ErrorStrategy& operator=(Antlr4ErrorStrategy const&) = delete;

private:
    void recover(antlr4::Parser* recognizer, std::exception_ptr e) override {
        LOGS(_log, LOG_LVL_DEBUG,
             __FUNCTION__ << " antlr4 could not make a parse tree out of the input statement:" << _statement);
        throw lsst::sqlrw::parser::ParseException(failureMessage(_statement));
    }

    antlr4::Token* recoverInline(antlr4::Parser* recognizer) override {
        LOGS(_log, LOG_LVL_DEBUG,
             __FUNCTION__ << " antlr4 could not make a parse tree out of the input statement:" << _statement);
        throw lsst::sqlrw::parser::ParseException(failureMessage(_statement));
    }

    void sync(antlr4::Parser* recognizer) override {
        // we want this function to be a no-op so we override it.
    }

    std::string const& _statement;
};

/// Lexer that throws on characters it can not tokenize.
class NonRecoveringHiveSqlLexer : public HiveSqlLexer {
public:
    NonRecoveringHiveSqlLexer(antlr4::CharStream* input, std::string const& statement)
            : HiveSqlLexer(input), _statement(statement) {}
    NonRecoveringHiveSqlLexer() = delete;
    NonRecoveringHiveSqlLexer(NonRecoveringHiveSqlLexer const&) = delete;
    NonRecoveringHiveSqlLexer& operator=(NonRecoveringHiveSqlLexer const&) = delete;

private:
    void recover(antlr4::LexerNoViableAltException const& e) override {
        LOGS(_log, LOG_LVL_DEBUG, __FUNCTION__ << " antlr4 could not tokenize the input statement:" << _statement);
        throw lsst::sqlrw::parser::ParseException(failureMessage(_statement));
    }

    std::string const& _statement;
};

/// Sends antlr4 diagnostics to the log instead of the console.
class LoggingErrorListener : public antlr4::BaseErrorListener {
public:
    void syntaxError(antlr4::Recognizer* recognizer, antlr4::Token* offendingSymbol, size_t line,
                     size_t charPositionInLine, std::string const& msg, std::exception_ptr e) override {
        LOGS(_log, LOG_LVL_DEBUG, "line " << line << ":" << charPositionInLine << " " << msg);
    }
};

}  // namespace

namespace lsst::sqlrw::parser {

StatementParser::StatementParser(std::string const& statement)
        : _statement(statement), _errorListener(std::make_unique<LoggingErrorListener>()) {
    _input = std::make_unique<antlr4::ANTLRInputStream>(_statement);
    _lexer = std::make_unique<NonRecoveringHiveSqlLexer>(_input.get(), _statement);
    _lexer->removeErrorListeners();
    _lexer->addErrorListener(_errorListener.get());
    _tokens = std::make_unique<antlr4::CommonTokenStream>(_lexer.get());
    _tokens->fill();
    LOGS(_log, LOG_LVL_TRACE, "Lexed tokens:" << util::printable(getTokenPairs()));
}

StatementParser::~StatementParser() = default;

HiveSqlParser::SingleStatementContext* StatementParser::parse() {
    if (_tree != nullptr) return _tree;
    _parser = std::make_unique<HiveSqlParser>(_tokens.get());
    _parser->removeErrorListeners();
    _parser->addErrorListener(_errorListener.get());
    _parser->setErrorHandler(std::make_shared<Antlr4ErrorStrategy>(_statement));
    _tree = _parser->singleStatement();
    return _tree;
}

std::string StatementParser::getStringTree() { return parse()->toStringTree(_parser.get()); }

StatementParser::VecPairStr StatementParser::getTokenPairs() const {
    VecPairStr ret;
    for (auto const& t : _tokens->getTokens()) {
        std::string name = std::string(_lexer->getVocabulary().getSymbolicName(t->getType()));
        if (name.empty()) {
            name = std::string(_lexer->getVocabulary().getLiteralName(t->getType()));
        }
        ret.push_back(make_pair(std::move(name), t->getText()));
    }
    return ret;
}

bool StatementParser::isValid(std::string const& statement) {
    try {
        StatementParser parser(statement);
        parser.parse();
    } catch (ParseException const& e) {
        LOGS(_log, LOG_LVL_DEBUG, "invalid statement: " << e.what());
        return false;
    }
    return true;
}

}  // namespace lsst::sqlrw::parser
