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
#include "lang/ast.h"

#include <cmath>
#include <cstdlib>

namespace gcad {

const char* operator_symbol(BinaryOperator op) {
    switch(op) {
    case BinaryOperator::ADD: return "+";
    case BinaryOperator::SUBTRACT: return "-";
    case BinaryOperator::MULTIPLY: return "*";
    case BinaryOperator::DIVIDE: return "/";
    case BinaryOperator::POWER: return "^";
    }
    return "?";
}

namespace {

[[noreturn]] void malformed(const SyntaxNode& node) {
    throw SyntaxError(std::string("malformed syntax tree at ") + rule_name(node.rule), node.loc);
}

void expect_children(const SyntaxNode& node, size_t count) {
    if(node.children.size() != count) malformed(node);
}

BinaryOperator binary_operator(const SyntaxNode& op) {
    if(op.rule != Rule::OPERATOR) malformed(op);
    if(op.text == "+") return BinaryOperator::ADD;
    if(op.text == "-") return BinaryOperator::SUBTRACT;
    if(op.text == "*") return BinaryOperator::MULTIPLY;
    if(op.text == "/") return BinaryOperator::DIVIDE;
    if(op.text == "^") return BinaryOperator::POWER;
    malformed(op);
}

NodePtr lower_expr(const SyntaxNode& node);
NodePtr lower_statement(const SyntaxNode& node);

std::unique_ptr<Block> lower_block(const SyntaxNode& node) {
    if(node.rule != Rule::BLOCK) malformed(node);
    auto block = std::make_unique<Block>(node.loc);
    for(const auto& c : node.children) block->statements.push_back(lower_statement(*c));
    return block;
}

NodePtr lower_number(const SyntaxNode& node) {
    auto lit = std::make_unique<Literal>(node.loc);
    double value = std::strtod(node.text.c_str(), nullptr);
    if(!std::isfinite(value)) throw SyntaxError("number literal out of range", node.loc);
    Unit unit = Unit::NONE;
    if(node.rule == Rule::UNIT_NUMBER && !parse_unit(node.unit, unit)) malformed(node);
    lit->number = Number(value, unit);
    return std::move(lit);
}

// Fill positional slots in declared order, then named ones; a slot may be
// filled once.
NodePtr lower_call(const SyntaxNode& node) {
    expect_children(node, 2);
    const SyntaxNode& name = node.child(0);
    const SyntaxNode& params = node.child(1);
    const BuiltinSpec* spec = find_builtin(name.text);
    if(!spec) throw NameError("unknown function '" + name.text + "'", name.loc);

    auto call = std::make_unique<FunctionCall>(node.loc, spec);
    const auto& schema = spec->params;
    size_t positional = 0;
    for(const auto& p : params.children) {
        if(p->rule != Rule::POSITIONAL_PARAM) continue;
        expect_children(*p, 1);
        if(positional >= schema.size()) {
            throw BindingError(std::string(spec->name) + "() takes at most " + std::to_string(schema.size()) +
                               " positional arguments", p->loc);
        }
        call->args[positional] = lower_expr(p->child(0));
        call->arg_locs[positional] = p->loc;
        positional++;
    }
    for(const auto& p : params.children) {
        if(p->rule == Rule::POSITIONAL_PARAM) continue;
        if(p->rule != Rule::NAMED_PARAM) malformed(*p);
        expect_children(*p, 2);
        const std::string& pname = p->child(0).text;
        size_t slot = schema.size();
        for(size_t k = 0; k < schema.size(); k++) {
            if(pname == schema[k].name) slot = k;
        }
        if(slot == schema.size()) {
            throw BindingError(std::string(spec->name) + "() has no parameter '" + pname + "'", p->loc);
        }
        if(call->args[slot]) {
            const char* how = slot < positional ? "' already given positionally" : "' given more than once";
            throw BindingError(std::string(spec->name) + "() parameter '" + pname + how, p->loc);
        }
        call->args[slot] = lower_expr(p->child(1));
        call->arg_locs[slot] = p->loc;
    }
    for(size_t k = 0; k < schema.size(); k++) {
        if(schema[k].required && !call->args[k]) {
            throw BindingError(std::string(spec->name) + "() missing required parameter '" + schema[k].name + "'", node.loc);
        }
    }
    return std::move(call);
}

NodePtr lower_expr(const SyntaxNode& node) {
    switch(node.rule) {
    case Rule::STRING: {
        auto lit = std::make_unique<Literal>(node.loc);
        lit->is_string = true;
        lit->text = node.text;
        return std::move(lit);
    }
    case Rule::UNITLESS_NUMBER:
    case Rule::UNIT_NUMBER:
        return lower_number(node);
    case Rule::IDENT:
        return std::make_unique<Identifier>(node.loc, node.text);
    case Rule::ASSIGN:
        expect_children(node, 2);
        return std::make_unique<Assignment>(node.loc, node.child(0).text, lower_expr(node.child(1)));
    case Rule::MATH_EXPR:
    case Rule::TERM: {
        if(node.children.size() < 3 || node.children.size() % 2 == 0) malformed(node);
        NodePtr lhs = lower_expr(node.child(0));
        for(size_t k = 1; k + 1 < node.children.size(); k += 2) {
            const SyntaxNode& op = node.child(k);
            NodePtr rhs = lower_expr(node.child(k + 1));
            lhs = std::make_unique<BinaryOp>(op.loc, binary_operator(op), std::move(lhs), std::move(rhs));
        }
        return lhs;
    }
    case Rule::POWER:
        expect_children(node, 3);
        return std::make_unique<BinaryOp>(node.child(1).loc, BinaryOperator::POWER,
                                          lower_expr(node.child(0)), lower_expr(node.child(2)));
    case Rule::NEGATION:
        expect_children(node, 2);
        return std::make_unique<UnaryOp>(node.loc, UnaryOperator::NEGATE, lower_expr(node.child(1)));
    case Rule::FACTORIAL:
        expect_children(node, 2);
        return std::make_unique<UnaryOp>(node.child(1).loc, UnaryOperator::FACTORIAL, lower_expr(node.child(0)));
    case Rule::FUNC_CALL:
        return lower_call(node);
    default:
        malformed(node);
    }
}

NodePtr lower_statement(const SyntaxNode& node) {
    switch(node.rule) {
    case Rule::EXPR_STATEMENT:
        expect_children(node, 1);
        return lower_expr(node.child(0));
    case Rule::BLOCK:
        return lower_block(node);
    case Rule::FOR_LOOP: {
        expect_children(node, 3);
        auto loop = std::make_unique<ForLoop>(node.loc);
        loop->variable = node.child(0).text;
        loop->source = lower_expr(node.child(1));
        loop->body = lower_block(node.child(2));
        return std::move(loop);
    }
    default:
        malformed(node);
    }
}

} // namespace

std::unique_ptr<Program> build_ast(const SyntaxNode& root) {
    if(root.rule != Rule::PROGRAM) malformed(root);
    auto program = std::make_unique<Program>(root.loc);
    for(const auto& c : root.children) program->statements.push_back(lower_statement(*c));
    return program;
}

} // namespace gcad
