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
#include "gcad/compiler.h"
#include "gcode/emitter.h"
#include "lang/ast.h"
#include "lang/parser.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace gcad {

Compiler::Compiler(const MachineConfig& config)
    : state_(config), evaluator(state_, toolpath_)
{}

void Compiler::run(const std::string& source, const std::string& name) {
    SyntaxPtr tree = parse(source);
    if(verbose) {
        std::cout << "parse tree of " << name << std::endl;
        print_syntax_tree(std::cout, *tree);
    }
    std::unique_ptr<Program> program = build_ast(*tree);

    // a run either completes or leaves the session as it was
    MachineState saved_state = state_;
    ScopeStack saved_scopes = evaluator.scopes();
    size_t saved_size = toolpath_.size();
    evaluator.verbose = verbose;
    try {
        evaluator.run(*program);
    } catch(const Error&) {
        state_ = saved_state;
        evaluator.scopes() = saved_scopes;
        toolpath_.truncate(saved_size);
        throw;
    }
    points_ = toolpath_.points();
    if(verbose) std::cout << name << ": " << toolpath_.size() << " segments" << std::endl;
}

void Compiler::run_file(const std::string& path) {
    std::ifstream fp(path);
    if(!fp.good()) throw ConfigError("cannot open '" + path + "'");
    std::stringstream buffer;
    buffer << fp.rdbuf();
    run(buffer.str(), path);
}

void Compiler::write(std::ostream& o) const {
    Emitter emitter(state_.config.precision, state_.config.safe_height);
    emitter.write(o, toolpath_);
}

std::string Compiler::output() const {
    std::ostringstream o;
    write(o);
    return o.str();
}

std::string compile(const std::string& source, const MachineConfig& config) {
    Compiler compiler(config);
    compiler.run(source);
    return compiler.output();
}

} // namespace gcad
