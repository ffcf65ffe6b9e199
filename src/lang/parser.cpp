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
#include "lang/parser.h"

#include <ostream>

namespace gcad {

const char* rule_name(Rule rule) {
    switch(rule) {
    case Rule::PROGRAM: return "program";
    case Rule::FOR_LOOP: return "forLoop";
    case Rule::BLOCK: return "block";
    case Rule::EXPR_STATEMENT: return "statement";
    case Rule::ASSIGN: return "assign";
    case Rule::MATH_EXPR: return "mathExpr";
    case Rule::TERM: return "term";
    case Rule::NEGATION: return "negation";
    case Rule::POWER: return "power";
    case Rule::FACTORIAL: return "factorial";
    case Rule::FUNC_CALL: return "funcCall";
    case Rule::PARAMS: return "params";
    case Rule::POSITIONAL_PARAM: return "positionalParam";
    case Rule::NAMED_PARAM: return "namedParam";
    case Rule::STRING: return "string";
    case Rule::UNITLESS_NUMBER: return "unitless_number";
    case Rule::UNIT_NUMBER: return "unit_number";
    case Rule::IDENT: return "ident";
    case Rule::OPERATOR: return "operator";
    }
    return "?";
}

Parser::Parser(std::vector<Token> tokens)
    : tokens(std::move(tokens))
{}

const Token& Parser::peek(size_t ahead) const {
    size_t k = pos + ahead;
    return k < tokens.size() ? tokens[k] : tokens.back();
}

bool Parser::check(TokenType type) const {
    return peek().type == type;
}

Token Parser::advance() {
    Token t = peek();
    if(t.type != TokenType::END) pos++;
    return t;
}

Token Parser::expect(TokenType type, const char* construct) {
    if(!check(type)) fail(std::string(token_type_name(type)) + " " + construct);
    return advance();
}

void Parser::fail(const std::string& expected) const {
    const Token& t = peek();
    std::string found = t.type == TokenType::END ? "end of input" : "'" + t.text + t.unit + "'";
    throw SyntaxError("expected " + expected + ", found " + found, t.loc);
}

SyntaxPtr Parser::leaf(Rule rule, const Token& token) {
    auto node = std::make_unique<SyntaxNode>(rule, token.loc);
    node->text = token.text;
    node->unit = token.unit;
    return node;
}

SyntaxPtr Parser::parse_program() {
    auto program = std::make_unique<SyntaxNode>(Rule::PROGRAM, peek().loc);
    while(!check(TokenType::END)) {
        program->children.push_back(statement());
    }
    return program;
}

SyntaxPtr Parser::statement() {
    if(check(TokenType::FOR)) return for_loop();
    if(check(TokenType::LBRACE)) return block();
    auto node = std::make_unique<SyntaxNode>(Rule::EXPR_STATEMENT, peek().loc);
    node->children.push_back(expr());
    expect(TokenType::SEMICOLON, "after expression");
    return node;
}

SyntaxPtr Parser::for_loop() {
    auto node = std::make_unique<SyntaxNode>(Rule::FOR_LOOP, advance().loc);
    node->children.push_back(leaf(Rule::IDENT, expect(TokenType::IDENT, "as loop variable")));
    expect(TokenType::IN, "after loop variable");
    node->children.push_back(expr());
    node->children.push_back(block());
    return node;
}

SyntaxPtr Parser::block() {
    auto node = std::make_unique<SyntaxNode>(Rule::BLOCK, expect(TokenType::LBRACE, "to open block").loc);
    while(!check(TokenType::RBRACE)) {
        if(check(TokenType::END)) fail("'}' to close block");
        node->children.push_back(statement());
    }
    advance();
    return node;
}

SyntaxPtr Parser::expr() {
    if(check(TokenType::IDENT) && peek(1).type == TokenType::ASSIGN) return assign();
    return math_expr();
}

SyntaxPtr Parser::assign() {
    Token name = advance();
    auto node = std::make_unique<SyntaxNode>(Rule::ASSIGN, name.loc);
    node->children.push_back(leaf(Rule::IDENT, name));
    advance(); // '='
    node->children.push_back(expr());
    return node;
}

SyntaxPtr Parser::math_expr() {
    SyntaxPtr first = term();
    if(!check(TokenType::PLUS) && !check(TokenType::MINUS)) return first;
    auto node = std::make_unique<SyntaxNode>(Rule::MATH_EXPR, first->loc);
    node->children.push_back(std::move(first));
    while(check(TokenType::PLUS) || check(TokenType::MINUS)) {
        node->children.push_back(leaf(Rule::OPERATOR, advance()));
        node->children.push_back(term());
    }
    return node;
}

SyntaxPtr Parser::term() {
    SyntaxPtr first = unary();
    if(!check(TokenType::STAR) && !check(TokenType::SLASH)) return first;
    auto node = std::make_unique<SyntaxNode>(Rule::TERM, first->loc);
    node->children.push_back(std::move(first));
    while(check(TokenType::STAR) || check(TokenType::SLASH)) {
        node->children.push_back(leaf(Rule::OPERATOR, advance()));
        node->children.push_back(unary());
    }
    return node;
}

SyntaxPtr Parser::unary() {
    if(!check(TokenType::MINUS)) return power();
    auto node = std::make_unique<SyntaxNode>(Rule::NEGATION, peek().loc);
    node->children.push_back(leaf(Rule::OPERATOR, advance()));
    node->children.push_back(unary());
    return node;
}

SyntaxPtr Parser::power() {
    SyntaxPtr base = postfix();
    if(!check(TokenType::CARET)) return base;
    auto node = std::make_unique<SyntaxNode>(Rule::POWER, base->loc);
    node->children.push_back(std::move(base));
    node->children.push_back(leaf(Rule::OPERATOR, advance()));
    // right associative, and 2^-1 is allowed
    node->children.push_back(unary());
    return node;
}

SyntaxPtr Parser::postfix() {
    SyntaxPtr operand = trivial();
    while(check(TokenType::BANG)) {
        auto node = std::make_unique<SyntaxNode>(Rule::FACTORIAL, operand->loc);
        node->children.push_back(std::move(operand));
        node->children.push_back(leaf(Rule::OPERATOR, advance()));
        operand = std::move(node);
    }
    return operand;
}

SyntaxPtr Parser::trivial() {
    const Token& t = peek();
    switch(t.type) {
    case TokenType::STRING:
        return leaf(Rule::STRING, advance());
    case TokenType::INTEGER:
    case TokenType::DECIMAL:
        return leaf(t.unit.empty() ? Rule::UNITLESS_NUMBER : Rule::UNIT_NUMBER, advance());
    case TokenType::LPAREN: {
        advance();
        SyntaxPtr inner = expr();
        expect(TokenType::RPAREN, "to close parenthesis");
        return inner;
    }
    case TokenType::IDENT:
        if(peek(1).type == TokenType::LPAREN) return func_call();
        return leaf(Rule::IDENT, advance());
    default:
        fail("expression");
    }
}

SyntaxPtr Parser::func_call() {
    Token name = advance();
    auto node = std::make_unique<SyntaxNode>(Rule::FUNC_CALL, name.loc);
    node->children.push_back(leaf(Rule::IDENT, name));
    auto params = std::make_unique<SyntaxNode>(Rule::PARAMS, advance().loc);
    if(!check(TokenType::RPAREN)) {
        params->children.push_back(param());
        while(!check(TokenType::RPAREN)) {
            if(!check(TokenType::COMMA)) fail("',' or ')' in parameter list");
            advance();
            params->children.push_back(param());
        }
    }
    advance(); // ')'
    node->children.push_back(std::move(params));
    return node;
}

SyntaxPtr Parser::param() {
    if(check(TokenType::IDENT) && peek(1).type == TokenType::ASSIGN) {
        Token name = advance();
        auto node = std::make_unique<SyntaxNode>(Rule::NAMED_PARAM, name.loc);
        node->children.push_back(leaf(Rule::IDENT, name));
        advance(); // '='
        node->children.push_back(expr());
        return node;
    }
    auto node = std::make_unique<SyntaxNode>(Rule::POSITIONAL_PARAM, peek().loc);
    node->children.push_back(expr());
    return node;
}

SyntaxPtr parse(const std::string& source) {
    Lexer lexer(source);
    Parser parser(lexer.tokenize());
    return parser.parse_program();
}

void print_syntax_tree(std::ostream& o, const SyntaxNode& node, int indent) {
    for(int k = 1; k < indent; k++) o << "|    ";
    if(indent > 0) o << "|----";
    o << rule_name(node.rule);
    if(node.children.empty()) {
        o << ": " << node.text << node.unit;
    }
    o << "\n";
    for(const auto& c : node.children) print_syntax_tree(o, *c, indent + 1);
}

} // namespace gcad
