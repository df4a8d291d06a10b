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
#ifndef LSST_SQLRW_PARSER_STATEMENTPARSER_H
#define LSST_SQLRW_PARSER_STATEMENTPARSER_H

// System headers
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Third party headers
#include "antlr4-runtime.h"

// Sqlrw headers
#include "parser/HiveSqlLexer.h"
#include "parser/HiveSqlParser.h"

namespace lsst::sqlrw::parser {

/**
 * StatementParser drives the antlr4-based Hive SQL lexer and parser for one statement.
 *
 * Construction lexes the statement into a token stream (whitespace and comments are kept
 * on the hidden channel); parse() builds the concrete syntax tree on top of that stream.
 * The lexer and parser do not attempt error recovery: the first lexical or syntax error
 * raises ParseException. The token stream and the tree are owned by this object and stay
 * valid for its lifetime.
 */
class StatementParser {
public:
    typedef std::shared_ptr<StatementParser> Ptr;
    typedef std::vector<std::pair<std::string, std::string>> VecPairStr;

    /**
     * @brief Lex the statement.
     *
     * @param statement The sql statement to tokenize.
     *
     * @throws ParseException if the statement can not be tokenized.
     */
    explicit StatementParser(std::string const& statement);

    StatementParser() = delete;
    StatementParser(StatementParser const&) = delete;
    StatementParser& operator=(StatementParser const&) = delete;

    ~StatementParser();

    /// @return the statement given to the constructor.
    std::string const& getStatement() const { return _statement; }

    /// @return the complete token stream of the statement, hidden channel included.
    antlr4::CommonTokenStream* getTokens() { return _tokens.get(); }

    /**
     * @brief Parse the statement to the top-level statement production.
     *
     * Repeated calls return the tree built by the first call.
     *
     * @throws ParseException if the statement is not valid Hive SQL.
     */
    HiveSqlParser::SingleStatementContext* parse();

    /// @return the LISP-style string tree of the parsed statement (for debugging).
    std::string getStringTree();

    /// @return (token type name, token text) for every token of the stream.
    VecPairStr getTokenPairs() const;

    /// @return true if the statement lexes and parses as Hive SQL.
    static bool isValid(std::string const& statement);

private:
    std::string const _statement;
    std::unique_ptr<antlr4::ANTLRErrorListener> _errorListener;
    std::unique_ptr<antlr4::ANTLRInputStream> _input;
    std::unique_ptr<HiveSqlLexer> _lexer;
    std::unique_ptr<antlr4::CommonTokenStream> _tokens;
    std::unique_ptr<HiveSqlParser> _parser;
    HiveSqlParser::SingleStatementContext* _tree = nullptr;
};

}  // namespace lsst::sqlrw::parser

#endif  // LSST_SQLRW_PARSER_STATEMENTPARSER_H
