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
#include "engine/evaluator.h"
#include "engine/operations.h"

#include <cmath>
#include <iostream>

namespace gcad {

Evaluator::Evaluator(MachineState& state, Toolpath& toolpath)
    : state(state), toolpath(toolpath)
{}

void Evaluator::run(const Program& program) {
    for(const auto& stmt : program.statements) {
        if(verbose) {
            std::cout << "line " << stmt->loc.line << ": " << toolpath.size() << " segments so far" << std::endl;
        }
        eval(*stmt);
    }
}

Value Evaluator::eval(const Node& node) {
    try {
        switch(node.kind) {
        case Node::Kind::LITERAL: {
            const auto& lit = static_cast<const Literal&>(node);
            if(lit.is_string) return Value::string(lit.text);
            return Value(lit.number);
        }
        case Node::Kind::IDENTIFIER: {
            const auto& id = static_cast<const Identifier&>(node);
            const Value* v = scopes_.lookup(id.name);
            if(!v) throw NameError("name '" + id.name + "' is not defined");
            return *v;
        }
        case Node::Kind::BINARY_OP:
            return binary(static_cast<const BinaryOp&>(node));
        case Node::Kind::UNARY_OP:
            return unary(static_cast<const UnaryOp&>(node));
        case Node::Kind::ASSIGNMENT: {
            const auto& a = static_cast<const Assignment&>(node);
            Value v = eval(*a.value);
            scopes_.bind(a.name, v);
            return v;
        }
        case Node::Kind::FUNCTION_CALL:
            return call(static_cast<const FunctionCall&>(node));
        case Node::Kind::FOR_LOOP:
            return for_loop(static_cast<const ForLoop&>(node));
        case Node::Kind::BLOCK: {
            ScopeGuard guard(scopes_);
            for(const auto& stmt : static_cast<const Block&>(node).statements) eval(*stmt);
            return Value();
        }
        case Node::Kind::PROGRAM:
            run(static_cast<const Program&>(node));
            return Value();
        }
    } catch(Error& e) {
        e.locate(node.loc);
        throw;
    }
    return Value();
}

Value Evaluator::binary(const BinaryOp& node) {
    Value lhs = eval(*node.lhs);
    Value rhs = eval(*node.rhs);
    if(!lhs.is_number() || !rhs.is_number()) {
        throw TypeError(std::string("unsupported operands for '") + operator_symbol(node.op) + "': " +
                        lhs.kind_name() + " and " + rhs.kind_name());
    }
    switch(node.op) {
    case BinaryOperator::ADD: return add(lhs.number, rhs.number);
    case BinaryOperator::SUBTRACT: return subtract(lhs.number, rhs.number);
    case BinaryOperator::MULTIPLY: return multiply(lhs.number, rhs.number);
    case BinaryOperator::DIVIDE: return divide(lhs.number, rhs.number);
    case BinaryOperator::POWER: return power(lhs.number, rhs.number);
    }
    return Value();
}

Value Evaluator::unary(const UnaryOp& node) {
    Value v = eval(*node.operand);
    const char* symbol = node.op == UnaryOperator::NEGATE ? "-" : "!";
    if(!v.is_number()) {
        throw TypeError(std::string("unsupported operand for '") + symbol + "': " + v.kind_name());
    }
    if(node.op == UnaryOperator::NEGATE) return negate(v.number);
    return factorial(v.number);
}

Value Evaluator::for_loop(const ForLoop& node) {
    Value source = eval(*node.source);
    if(!source.is_sequence()) {
        throw TypeError(std::string("for loop needs a sequence to iterate, got ") + source.kind_name(), node.source->loc);
    }
    if(verbose) std::cout << "for " << node.variable << " in " << source << std::endl;
    for(const auto& item : source.items) {
        // fresh frame per iteration so nothing leaks between them
        ScopeGuard guard(scopes_);
        scopes_.bind(node.variable, item);
        for(const auto& stmt : node.body->statements) eval(*stmt);
    }
    return Value();
}

void Evaluator::check_argument(const FunctionCall& node, size_t k, const Value& v) const {
    const ParamSpec& p = node.spec->params[k];
    bool ok = false;
    switch(p.kind) {
    case ParamKind::LENGTH: ok = v.is_number() && v.number.is_length(); break;
    case ParamKind::NUMBER: ok = v.is_number() && !v.number.is_length(); break;
    case ParamKind::ANY_NUMBER: ok = v.is_number(); break;
    case ParamKind::STRING: ok = v.is_string(); break;
    }
    if(!ok) {
        throw TypeError(std::string(node.spec->name) + "() parameter '" + p.name + "' must be a " +
                        param_kind_name(p.kind) + ", got " + v.kind_name(), node.arg_locs[k]);
    }
}

static double mm(const Value& v) {
    double value = v.number.canonical();
    if(!std::isfinite(value)) throw RuntimeError("length " + v.number.str() + " is out of range");
    return value;
}

Value Evaluator::call(const FunctionCall& node) {
    const size_t n = node.spec->params.size();
    std::vector<Value> args(n);
    for(size_t k = 0; k < n; k++) {
        if(!node.args[k]) continue;
        args[k] = eval(*node.args[k]);
        check_argument(node, k, args[k]);
    }
    toolpath.set_line(node.loc.line);

    switch(node.spec->id) {
    case Builtin::CUTTER_DIAMETER: {
        double d = mm(args[0]);
        if(!(d > 0.)) throw RuntimeError("cutter diameter must be positive, got " + args[0].number.str());
        state.cutter_diameter = d;
        break;
    }
    case Builtin::MATERIAL:
        state.select_material(args[0].text);
        break;
    case Builtin::DEFINE_MATERIAL: {
        MaterialProfile m{args[0].text, args[1].number.value, mm(args[2]),
                          args[3].number.value, args[4].number.value, args[5].number.value};
        if(!(m.stepover > 0. && m.stepover <= 1.)) throw RuntimeError("stepover must be a fraction in (0, 1]");
        if(!(m.stepdown > 0.)) throw RuntimeError("stepdown must be positive");
        if(!(m.feed_rate > 0. && m.plunge_rate > 0.)) throw RuntimeError("feed and plunge rates must be positive");
        if(m.rpm < 0.) throw RuntimeError("rpm must not be negative");
        state.define_material(m);
        break;
    }
    case Builtin::RPM:
        if(args[0].number.value < 0.) throw RuntimeError("rpm must not be negative");
        state.rpm = args[0].number.value;
        break;
    case Builtin::SCALE:
        if(!(args[0].number.value > 0. && args[1].number.value > 0.)) {
            throw RuntimeError("scale factors must be positive");
        }
        state.scale_x = args[0].number.value;
        state.scale_y = args[1].number.value;
        break;
    case Builtin::COMMENT:
        comment(toolpath, args[0].text);
        break;
    case Builtin::DWELL:
        dwell(toolpath, args[0].number.value);
        break;
    case Builtin::DRILL: {
        double peck = args[3].is_none() ? state.config.peck_depth : mm(args[3]);
        drill(state, toolpath, mm(args[0]), mm(args[1]), mm(args[2]), peck);
        break;
    }
    case Builtin::CIRCLE_POCKET: {
        bool has_radius = !args[2].is_none(), has_diameter = !args[4].is_none();
        if(has_radius == has_diameter) {
            throw BindingError("circle_pocket() needs exactly one of 'radius' or 'diameter'");
        }
        double radius = has_radius ? mm(args[2]) : mm(args[4]) / 2.;
        circle_pocket(state, toolpath, mm(args[0]), mm(args[1]), radius, mm(args[3]));
        break;
    }
    case Builtin::GROOVE: {
        V2d from(mm(args[0]), mm(args[1]));
        bool has_end = !args[2].is_none() || !args[3].is_none();
        if(has_end == !args[7].is_none()) {
            throw BindingError("groove() needs either 'x2' and 'y2' or 'up'");
        }
        if(has_end && (args[2].is_none() || args[3].is_none())) {
            throw BindingError("groove() needs both 'x2' and 'y2'");
        }
        // `up` is a straight cut along +Y
        V2d to = has_end ? V2d(mm(args[2]), mm(args[3])) : V2d(from.x, from.y + mm(args[7]));
        if(args[5].is_none() != args[6].is_none()) {
            throw BindingError("groove() needs both 'cx' and 'cy' for an arc");
        }
        if(args[5].is_none()) groove(state, toolpath, from, to, mm(args[4]));
        else arc_groove(state, toolpath, from, to, V2d(mm(args[5]), mm(args[6])), mm(args[4]));
        break;
    }
    case Builtin::GROOVE_POCKET:
        groove_pocket(state, toolpath, mm(args[0]), mm(args[1]), mm(args[2]), mm(args[3]), mm(args[4]));
        break;
    case Builtin::LINSPACE:
        return linspace(args[0].number, args[1].number, args[2].number, state.config.max_sequence);
    }
    return Value();
}

} // namespace gcad
