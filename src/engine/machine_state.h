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
#include "common/vec.h"

#include <string>
#include <vector>

namespace gcad {

// Feeds and speeds for one stock material.
struct MaterialProfile {
    std::string name;
    double stepover;     // max lateral step, fraction of the cutter diameter
    double stepdown;     // max depth per pass, mm
    double feed_rate;    // mm/min
    double plunge_rate;  // mm/min
    double rpm;
};

const std::vector<MaterialProfile>& builtin_materials();

struct MachineConfig {
    double safe_height = 5.;          // mm above the stock surface (z = 0)
    double clearance = .25;           // rapid descend stops this far above the work
    double peck_depth = 2.;           // default max depth of one drill peck
    double cutter_diameter = 3.175;
    std::string material = "default";
    int precision = 3;                // decimals in the output
    size_t max_sequence = 1000000;    // largest linspace() count
};

// Everything machining operations read or change while a program runs.
struct MachineState {
    MachineConfig config;
    std::vector<MaterialProfile> materials;

    double cutter_diameter;
    MaterialProfile material;
    double rpm;                       // spindle speed to run the next cut at
    V3d position;                     // last commanded tool position
    bool position_known = false;      // nothing commanded yet
    double scale_x = 1.;
    double scale_y = 1.;

    // what the output has last been told
    double announced_rpm = -1.;
    std::string announced_tool;

    explicit MachineState(const MachineConfig& config = MachineConfig());

    // Throws ConfigError for names not in the table.
    void select_material(const std::string& name);
    // Adds a profile or replaces the one with the same name.
    void define_material(const MaterialProfile& profile);
    const MaterialProfile* find_material(const std::string& name) const;

    double stepover() const { return material.stepover * cutter_diameter; }
};

} // namespace gcad
