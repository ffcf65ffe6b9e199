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
#include "common/errors.h"

#include <string>
#include <vector>

namespace gcad {

enum class TokenType {
    IDENT,
    FOR,
    IN,
    INTEGER,    // 12
    DECIMAL,    // 12.5
    STRING,     // 'it''s'
    PLUS, MINUS, STAR, SLASH, CARET, BANG,
    ASSIGN,
    LPAREN, RPAREN,
    LBRACE, RBRACE,
    COMMA, SEMICOLON,
    END
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type;
    std::string text;   // source text; decoded contents for STRING
    std::string unit;   // unit suffix glued to a number, empty otherwise
    SourceLocation loc;
};

// Splits a script into tokens. Whitespace and // comments are dropped.
class Lexer {
public:
    explicit Lexer(const std::string& source);

    std::vector<Token> tokenize();

private:
    char peek(size_t ahead = 0) const;
    char advance();
    void skip_space();
    Token number();
    Token string();
    Token ident();
    Token simple(TokenType type);

    std::string src;
    size_t i = 0;
    int line = 1;
    int column = 1;
    SourceLocation start;
};

} // namespace gcad
