/*
Licensed to the Apache Software Foundation (ASF) under one
or more contributor license agreements.  See the NOTICE file
distributed with this work for additional information
regarding copyright ownership.  The ASF licenses this file
to you under the Apache License, Version 2.0 (the
"License"); you may not use this file except in compliance
with the License.  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied.  See the License for the
specific language governing permissions and limitations
under the License.    
*/
#pragma once
#include "lang/lexer.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace gcad {

enum class Rule {
    PROGRAM,
    FOR_LOOP,
    BLOCK,
    EXPR_STATEMENT,
    ASSIGN,
    MATH_EXPR,      // additive chain
    TERM,           // multiplicative chain
    NEGATION,
    POWER,
    FACTORIAL,
    FUNC_CALL,
    PARAMS,
    POSITIONAL_PARAM,
    NAMED_PARAM,
    STRING,
    UNITLESS_NUMBER,
    UNIT_NUMBER,
    IDENT,
    OPERATOR
};

const char* rule_name(Rule rule);

// Concrete syntax tree node. Chains with a single operand are not wrapped,
// so `1 + 2` is MATH_EXPR(UNITLESS_NUMBER, OPERATOR, UNITLESS_NUMBER) while a
// bare `1` is just UNITLESS_NUMBER.
struct SyntaxNode {
    Rule rule;
    std::string text;   // leaves only
    std::string unit;   // UNIT_NUMBER only
    SourceLocation loc;
    std::vector<std::unique_ptr<SyntaxNode>> children;

    SyntaxNode(Rule rule, SourceLocation loc) : rule(rule), loc(loc) {}

    const SyntaxNode& child(size_t k) const { return *children[k]; }
};

using SyntaxPtr = std::unique_ptr<SyntaxNode>;

// Recursive descent parser for one program.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    SyntaxPtr parse_program();

private:
    const Token& peek(size_t ahead = 0) const;
    bool check(TokenType type) const;
    Token advance();
    Token expect(TokenType type, const char* construct);
    [[noreturn]] void fail(const std::string& expected) const;

    SyntaxPtr statement();
    SyntaxPtr for_loop();
    SyntaxPtr block();
    SyntaxPtr expr();
    SyntaxPtr assign();
    SyntaxPtr math_expr();
    SyntaxPtr term();
    SyntaxPtr unary();
    SyntaxPtr power();
    SyntaxPtr postfix();
    SyntaxPtr trivial();
    SyntaxPtr func_call();
    SyntaxPtr param();
    SyntaxPtr leaf(Rule rule, const Token& token);

    std::vector<Token> tokens;
    size_t pos = 0;
};

// Lex and parse in one go.
SyntaxPtr parse(const std::string& source);

// Indented tree dump, one node per line, leaves followed by their text.
void print_syntax_tree(std::ostream& o, const SyntaxNode& node, int indent = 0);

} // namespace gcad
