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
#include "lang/builtins.h"
#include "lang/parser.h"
#include "units/units.h"

#include <memory>
#include <string>
#include <vector>

namespace gcad {

struct Node {
    enum class Kind {
        LITERAL,
        IDENTIFIER,
        BINARY_OP,
        UNARY_OP,
        ASSIGNMENT,
        FUNCTION_CALL,
        FOR_LOOP,
        BLOCK,
        PROGRAM
    };

    Kind kind;
    SourceLocation loc;

    Node(Kind kind, SourceLocation loc) : kind(kind), loc(loc) {}
    virtual ~Node() {}
};

using NodePtr = std::unique_ptr<Node>;

struct Literal : Node {
    bool is_string = false;
    Number number;
    std::string text;

    explicit Literal(SourceLocation loc) : Node(Kind::LITERAL, loc) {}
};

struct Identifier : Node {
    std::string name;

    Identifier(SourceLocation loc, std::string name) : Node(Kind::IDENTIFIER, loc), name(std::move(name)) {}
};

enum class BinaryOperator {ADD, SUBTRACT, MULTIPLY, DIVIDE, POWER};
const char* operator_symbol(BinaryOperator op);

struct BinaryOp : Node {
    BinaryOperator op;
    NodePtr lhs, rhs;

    BinaryOp(SourceLocation loc, BinaryOperator op, NodePtr lhs, NodePtr rhs)
        : Node(Kind::BINARY_OP, loc), op(op), lhs(std::move(lhs)), rhs(std::move(rhs)) {}
};

enum class UnaryOperator {NEGATE, FACTORIAL};

struct UnaryOp : Node {
    UnaryOperator op;
    NodePtr operand;

    UnaryOp(SourceLocation loc, UnaryOperator op, NodePtr operand)
        : Node(Kind::UNARY_OP, loc), op(op), operand(std::move(operand)) {}
};

struct Assignment : Node {
    std::string name;
    NodePtr value;

    Assignment(SourceLocation loc, std::string name, NodePtr value)
        : Node(Kind::ASSIGNMENT, loc), name(std::move(name)), value(std::move(value)) {}
};

// Arguments are already bound to the builtin's parameter slots: args[k] is
// the expression for spec->params[k], or null when it was not supplied.
struct FunctionCall : Node {
    const BuiltinSpec* spec;
    std::vector<NodePtr> args;
    std::vector<SourceLocation> arg_locs;

    FunctionCall(SourceLocation loc, const BuiltinSpec* spec)
        : Node(Kind::FUNCTION_CALL, loc), spec(spec),
          args(spec->params.size()), arg_locs(spec->params.size()) {}
};

struct Block : Node {
    std::vector<NodePtr> statements;

    explicit Block(SourceLocation loc) : Node(Kind::BLOCK, loc) {}
};

struct ForLoop : Node {
    std::string variable;
    NodePtr source;
    std::unique_ptr<Block> body;

    explicit ForLoop(SourceLocation loc) : Node(Kind::FOR_LOOP, loc) {}
};

struct Program : Node {
    std::vector<NodePtr> statements;

    explicit Program(SourceLocation loc) : Node(Kind::PROGRAM, loc) {}
};

// Lowers a concrete syntax tree into the typed AST, resolving call targets
// and binding arguments to parameter slots.
std::unique_ptr<Program> build_ast(const SyntaxNode& root);

} // namespace gcad
