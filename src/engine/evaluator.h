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
#include "engine/machine_state.h"
#include "engine/scope.h"
#include "engine/value.h"
#include "gcode/toolpath.h"
#include "lang/ast.h"

namespace gcad {

// Walks the AST in program order. Machining calls read and change `state`
// and append to `toolpath`; both are owned by the caller.
class Evaluator {
public:
    Evaluator(MachineState& state, Toolpath& toolpath);

    void run(const Program& program);
    Value eval(const Node& node);

    ScopeStack& scopes() { return scopes_; }

    bool verbose = false;

private:
    Value binary(const BinaryOp& node);
    Value unary(const UnaryOp& node);
    Value for_loop(const ForLoop& node);
    Value call(const FunctionCall& node);
    void check_argument(const FunctionCall& node, size_t k, const Value& v) const;

    MachineState& state;
    Toolpath& toolpath;
    ScopeStack scopes_;
};

} // namespace gcad
