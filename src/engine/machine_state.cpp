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
#include "engine/machine_state.h"
#include "common/errors.h"

namespace gcad {

const std::vector<MaterialProfile>& builtin_materials() {
    static const std::vector<MaterialProfile> materials = {
        // name, stepover, stepdown, feed, plunge, rpm
        {"default", .4, 1., 600., 200., 12000.},
        {"wood", .45, 2., 1200., 400., 16000.},
        {"mdf", .45, 1.5, 1000., 300., 16000.},
        {"acrylic", .4, 1., 800., 200., 14000.},
        {"aluminium", .3, .5, 400., 100., 10000.},
        {"brass", .3, .4, 300., 80., 8000.},
        {"steel", .2, .2, 150., 40., 4000.},
    };
    return materials;
}

MachineState::MachineState(const MachineConfig& config)
    : config(config), materials(builtin_materials()), cutter_diameter(config.cutter_diameter),
      position(0., 0., config.safe_height)
{
    select_material(config.material);
}

const MaterialProfile* MachineState::find_material(const std::string& name) const {
    for(const auto& m : materials) {
        if(m.name == name) return &m;
    }
    return nullptr;
}

void MachineState::select_material(const std::string& name) {
    const MaterialProfile* profile = find_material(name);
    if(!profile) throw ConfigError("unknown material '" + name + "'");
    material = *profile;
    rpm = material.rpm;
}

void MachineState::define_material(const MaterialProfile& profile) {
    bool replaced = false;
    for(auto& m : materials) {
        if(m.name == profile.name) {
            m = profile;
            replaced = true;
        }
    }
    if(!replaced) materials.push_back(profile);
    // redefining the active material takes effect immediately
    if(profile.name == material.name) select_material(profile.name);
}

} // namespace gcad
