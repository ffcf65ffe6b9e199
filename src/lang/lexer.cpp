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
#include "lang/lexer.h"
#include "units/units.h"

#include <cctype>

namespace gcad {

const char* token_type_name(TokenType type) {
    switch(type) {
    case TokenType::IDENT: return "identifier";
    case TokenType::FOR: return "'for'";
    case TokenType::IN: return "'in'";
    case TokenType::INTEGER: return "integer";
    case TokenType::DECIMAL: return "decimal";
    case TokenType::STRING: return "string";
    case TokenType::PLUS: return "'+'";
    case TokenType::MINUS: return "'-'";
    case TokenType::STAR: return "'*'";
    case TokenType::SLASH: return "'/'";
    case TokenType::CARET: return "'^'";
    case TokenType::BANG: return "'!'";
    case TokenType::ASSIGN: return "'='";
    case TokenType::LPAREN: return "'('";
    case TokenType::RPAREN: return "')'";
    case TokenType::LBRACE: return "'{'";
    case TokenType::RBRACE: return "'}'";
    case TokenType::COMMA: return "','";
    case TokenType::SEMICOLON: return "';'";
    case TokenType::END: return "end of input";
    }
    return "?";
}

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

Lexer::Lexer(const std::string& source)
    : src(source)
{}

char Lexer::peek(size_t ahead) const {
    return i + ahead < src.size() ? src[i + ahead] : '\0';
}

char Lexer::advance() {
    char c = src[i++];
    if(c == '\n') {
        line++;
        column = 1;
    } else {
        column++;
    }
    return c;
}

void Lexer::skip_space() {
    while(i < src.size()) {
        char c = peek();
        if(c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if(c == '/' && peek(1) == '/') {
            while(i < src.size() && peek() != '\n') advance();
        } else {
            break;
        }
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while(true) {
        skip_space();
        start = SourceLocation(line, column);
        if(i >= src.size()) {
            tokens.push_back(Token{TokenType::END, "", "", start});
            break;
        }
        char c = peek();
        if(is_digit(c)) {
            tokens.push_back(number());
        } else if(c == '\'') {
            tokens.push_back(string());
        } else if(is_ident_start(c)) {
            tokens.push_back(ident());
        } else {
            switch(c) {
            case '+': tokens.push_back(simple(TokenType::PLUS)); break;
            case '-': tokens.push_back(simple(TokenType::MINUS)); break;
            case '*': tokens.push_back(simple(TokenType::STAR)); break;
            case '/': tokens.push_back(simple(TokenType::SLASH)); break;
            case '^': tokens.push_back(simple(TokenType::CARET)); break;
            case '!': tokens.push_back(simple(TokenType::BANG)); break;
            case '=': tokens.push_back(simple(TokenType::ASSIGN)); break;
            case '(': tokens.push_back(simple(TokenType::LPAREN)); break;
            case ')': tokens.push_back(simple(TokenType::RPAREN)); break;
            case '{': tokens.push_back(simple(TokenType::LBRACE)); break;
            case '}': tokens.push_back(simple(TokenType::RBRACE)); break;
            case ',': tokens.push_back(simple(TokenType::COMMA)); break;
            case ';': tokens.push_back(simple(TokenType::SEMICOLON)); break;
            default:
                throw SyntaxError(std::string("unexpected character '") + c + "'", start);
            }
        }
    }
    return tokens;
}

Token Lexer::simple(TokenType type) {
    std::string text(1, advance());
    return Token{type, text, "", start};
}

Token Lexer::number() {
    std::string text;
    TokenType type = TokenType::INTEGER;
    while(is_digit(peek())) text += advance();
    if(peek() == '.' && is_digit(peek(1))) {
        type = TokenType::DECIMAL;
        text += advance();
        while(is_digit(peek())) text += advance();
    }
    std::string unit;
    if(is_ident_start(peek())) {
        SourceLocation suffix_loc(line, column);
        while(is_ident_char(peek())) unit += advance();
        Unit parsed;
        if(!parse_unit(unit, parsed)) {
            throw SyntaxError("expected unit suffix (mm, cm, m, in, ft, yd), found '" + unit + "'", suffix_loc);
        }
    }
    return Token{type, text, unit, start};
}

Token Lexer::string() {
    advance(); // opening quote
    std::string text;
    while(true) {
        if(i >= src.size()) throw SyntaxError("unterminated string", start);
        char c = advance();
        if(c == '\'') {
            if(peek() == '\'') {
                text += advance();
            } else {
                break;
            }
        } else {
            text += c;
        }
    }
    return Token{TokenType::STRING, text, "", start};
}

Token Lexer::ident() {
    std::string text;
    while(is_ident_char(peek())) text += advance();
    TokenType type = TokenType::IDENT;
    if(text == "for") type = TokenType::FOR;
    else if(text == "in") type = TokenType::IN;
    return Token{type, text, "", start};
}

} // namespace gcad
