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
#include "engine/value.h"
#include "gcode/toolpath.h"

namespace gcad {

// Appends moves for one operation, tracking the tool position and applying
// the XY scale. All arguments are in (unscaled) program coordinates, mm.
class PathWriter {
public:
    PathWriter(MachineState& state, Toolpath& out);

    // Rapid to safe height above (x, y), announce tool and spindle if they
    // changed, then rapid down to clearance.
    void begin(double x, double y);
    void rapid(double x, double y, double z);
    void rapid_z(double z);
    void plunge(double z);
    void cut(double x, double y);
    void arc_ccw(double x, double y, double cx, double cy);
    void retract();

private:
    V3d machine(double x, double y, double z) const;
    void announce();
    void move(SegmentType type, const V3d& target, double feed);

    MachineState& state;
    Toolpath& out;
};

// Upper bound on the passes, pecks or rings one operation may take.
constexpr int MAX_STEPS = 100000;

// Number of steps, at least 1, so that none exceeds `step`. Throws
// RuntimeError beyond MAX_STEPS.
int step_count(const char* what, double distance, double step);
// Number of depth passes so that none exceeds `stepdown`.
int depth_passes(double depth, double stepdown);
// Depth reached after pass `k` of `n` (1-based); the last is exactly `depth`.
double pass_depth(double depth, int k, int n);

void drill(MachineState& state, Toolpath& out, double x, double y, double depth, double peck);
void circle_pocket(MachineState& state, Toolpath& out, double cx, double cy, double radius, double depth);
void groove(MachineState& state, Toolpath& out, const V2d& from, const V2d& to, double depth);
void arc_groove(MachineState& state, Toolpath& out, const V2d& from, const V2d& to, const V2d& center, double depth);
void groove_pocket(MachineState& state, Toolpath& out, double x, double y, double width, double height, double depth);

void comment(Toolpath& out, const std::string& text);
void dwell(Toolpath& out, double seconds);

// `count` evenly spaced numbers from start to stop inclusive.
Value linspace(const Number& start, const Number& stop, const Number& count, size_t max_count);

} // namespace gcad
