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
#include "engine/evaluator.h"
#include "engine/machine_state.h"
#include "gcode/toolpath.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace gcad {

// One compilation session. Several scripts may be run in turn (a material
// profile first, then the job); they share machine state, variables and
// the output toolpath.
class Compiler {
public:
    explicit Compiler(const MachineConfig& config = MachineConfig());
    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    // Throws gcad::Error on the first error, after undoing everything the
    // failed script did. `name` is only used in traces.
    void run(const std::string& source, const std::string& name = "<string>");
    void run_file(const std::string& path);

    std::string output() const;
    void write(std::ostream& o) const;

    const Toolpath& toolpath() const { return toolpath_; }
    const MachineState& state() const { return state_; }
    // Flattened motion rows, refreshed after every run().
    std::vector<double>& points() { return points_; }

    bool verbose = false;

private:
    MachineState state_;
    Toolpath toolpath_;
    Evaluator evaluator;
    std::vector<double> points_;
};

// Compile a complete program to G-code text.
std::string compile(const std::string& source, const MachineConfig& config = MachineConfig());

} // namespace gcad
