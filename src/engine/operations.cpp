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
#include "engine/operations.h"
#include "common/errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gcad {

constexpr bool DEBUG = false;
constexpr double EPSILON = 1e-9;
constexpr double ARC_TOLERANCE = 1e-3; // mm

static void require_positive(const char* what, double value) {
    if(!(value > 0.)) {
        std::ostringstream o;
        o << what << " must be positive, got " << value << "mm";
        throw RuntimeError(o.str());
    }
}

int step_count(const char* what, double distance, double step) {
    require_positive(what, step);
    double n = std::ceil(distance / step - EPSILON);
    if(!(n <= MAX_STEPS)) {
        std::ostringstream o;
        o << "covering " << distance << "mm in " << what << " of " << step << "mm needs more than "
          << MAX_STEPS << " passes";
        throw RuntimeError(o.str());
    }
    return n < 1. ? 1 : static_cast<int>(n);
}

int depth_passes(double depth, double stepdown) {
    return step_count("stepdown", depth, stepdown);
}

double pass_depth(double depth, int k, int n) {
    return k == n ? depth : depth * k / n;
}

PathWriter::PathWriter(MachineState& state, Toolpath& out)
    : state(state), out(out)
{}

V3d PathWriter::machine(double x, double y, double z) const {
    return V3d(x * state.scale_x, y * state.scale_y, z);
}

static void require_finite(const V3d& target) {
    if(!std::isfinite(target.x) || !std::isfinite(target.y) || !std::isfinite(target.z)) {
        throw RuntimeError("tool position out of range");
    }
}

void PathWriter::move(SegmentType type, const V3d& target, double feed) {
    require_finite(target);
    if(type != SegmentType::ARC_CCW && state.position_known && target == state.position) return;
    Segment s(type);
    s.target = target;
    s.feed = feed;
    out.push(s);
    state.position = target;
    state.position_known = true;
    if(DEBUG) std::cout << "move " << static_cast<int>(type) << " " << target << std::endl;
}

void PathWriter::announce() {
    std::ostringstream tool;
    tool << state.cutter_diameter << "mm cutter, " << state.material.name;
    if(tool.str() != state.announced_tool) {
        Segment s(SegmentType::TOOL_CHANGE);
        s.text = tool.str();
        out.push(s);
        state.announced_tool = tool.str();
    }
    if(state.rpm != state.announced_rpm) {
        Segment s(SegmentType::SPINDLE);
        s.rpm = state.rpm;
        out.push(s);
        state.announced_rpm = state.rpm;
    }
}

void PathWriter::begin(double x, double y) {
    rapid(x, y, state.config.safe_height);
    announce();
    rapid_z(state.config.clearance);
}

void PathWriter::rapid(double x, double y, double z) {
    move(SegmentType::RAPID, machine(x, y, z), 0.);
}

void PathWriter::rapid_z(double z) {
    V3d target = state.position;
    target.z = z;
    move(SegmentType::RAPID, target, 0.);
}

void PathWriter::plunge(double z) {
    V3d target = state.position;
    target.z = z;
    move(SegmentType::LINEAR, target, state.material.plunge_rate);
}

void PathWriter::cut(double x, double y) {
    move(SegmentType::LINEAR, machine(x, y, state.position.z), state.material.feed_rate);
}

void PathWriter::arc_ccw(double x, double y, double cx, double cy) {
    if(state.scale_x != state.scale_y) {
        throw RuntimeError("arc moves need a uniform scale");
    }
    Segment s(SegmentType::ARC_CCW);
    s.target = machine(x, y, state.position.z);
    s.center = V2d(cx * state.scale_x, cy * state.scale_y);
    require_finite(s.target);
    require_finite(V3d(s.center.x, s.center.y, 0.));
    s.feed = state.material.feed_rate;
    out.push(s);
    state.position = s.target;
}

void PathWriter::retract() {
    rapid_z(state.config.safe_height);
}

void drill(MachineState& state, Toolpath& out, double x, double y, double depth, double peck) {
    require_positive("drill depth", depth);
    require_positive("peck depth", peck);
    int pecks = depth_passes(depth, peck);
    PathWriter w(state, out);
    w.begin(x, y);
    for(int k = 1; k <= pecks; k++) {
        double z = -pass_depth(depth, k, pecks);
        w.plunge(z);
        // break the chip, then go on from just above the hole bottom
        if(k < pecks) w.rapid_z(z + state.config.clearance);
    }
    w.retract();
}

void circle_pocket(MachineState& state, Toolpath& out, double cx, double cy, double radius, double depth) {
    require_positive("pocket depth", depth);
    double d = state.cutter_diameter;
    if(2. * radius <= d) {
        std::ostringstream o;
        o << "pocket diameter " << 2. * radius << "mm must be larger than the cutter diameter " << d << "mm";
        throw RuntimeError(o.str());
    }
    // tool centre travels up to path_radius; rings are spaced evenly so no
    // step is wider than the material's stepover
    double path_radius = radius - d / 2.;
    int rings = step_count("stepover", path_radius, state.stepover());
    int passes = depth_passes(depth, state.material.stepdown);

    PathWriter w(state, out);
    w.begin(cx, cy);
    for(int k = 1; k <= passes; k++) {
        double z = -pass_depth(depth, k, passes);
        w.plunge(z);
        for(int ring = 1; ring <= rings; ring++) {
            double r = path_radius * ring / rings;
            w.cut(cx + r, cy);
            w.arc_ccw(cx - r, cy, cx, cy);
            w.arc_ccw(cx + r, cy, cx, cy);
        }
        if(k < passes) {
            w.rapid_z(z + state.config.clearance);
            w.rapid(cx, cy, z + state.config.clearance);
        }
    }
    w.retract();
}

void groove(MachineState& state, Toolpath& out, const V2d& from, const V2d& to, double depth) {
    require_positive("groove depth", depth);
    int passes = depth_passes(depth, state.material.stepdown);
    PathWriter w(state, out);
    w.begin(from.x, from.y);
    V2d a = from, b = to;
    for(int k = 1; k <= passes; k++) {
        w.plunge(-pass_depth(depth, k, passes));
        w.cut(b.x, b.y);
        std::swap(a, b);
    }
    w.retract();
}

void arc_groove(MachineState& state, Toolpath& out, const V2d& from, const V2d& to, const V2d& center, double depth) {
    require_positive("groove depth", depth);
    double r0 = (from - center).length();
    double r1 = (to - center).length();
    if(r0 < ARC_TOLERANCE) throw RuntimeError("arc groove start point lies on its centre");
    if(std::fabs(r0 - r1) > ARC_TOLERANCE) {
        std::ostringstream o;
        o << "arc groove end points are " << r0 << "mm and " << r1 << "mm from the centre";
        throw RuntimeError(o.str());
    }
    int passes = depth_passes(depth, state.material.stepdown);
    PathWriter w(state, out);
    w.begin(from.x, from.y);
    for(int k = 1; k <= passes; k++) {
        w.plunge(-pass_depth(depth, k, passes));
        w.arc_ccw(to.x, to.y, center.x, center.y);
        if(k < passes) {
            // the chord back to the start crosses uncut stock
            w.rapid_z(state.config.clearance);
            w.rapid(from.x, from.y, state.config.clearance);
        }
    }
    w.retract();
}

void groove_pocket(MachineState& state, Toolpath& out, double x, double y, double width, double height, double depth) {
    require_positive("pocket depth", depth);
    double d = state.cutter_diameter;
    if(width < d || height < d) {
        std::ostringstream o;
        o << "pocket " << width << "mm x " << height << "mm is smaller than the cutter diameter " << d << "mm";
        throw RuntimeError(o.str());
    }
    // rectangle the tool centre may travel
    double x0 = x + d / 2., y0 = y + d / 2.;
    double w0 = width - d, h0 = height - d;
    double half = std::min(w0, h0) / 2.;
    int loops = half > 0. ? step_count("stepover", half, state.stepover()) : 0;

    // concentric loops from the middle outwards
    std::vector<V2d> pattern;
    for(int k = loops; k >= 0; k--) {
        double o = loops ? half * k / loops : 0.;
        pattern.push_back(V2d(x0 + o, y0 + o));
        pattern.push_back(V2d(x0 + w0 - o, y0 + o));
        pattern.push_back(V2d(x0 + w0 - o, y0 + h0 - o));
        pattern.push_back(V2d(x0 + o, y0 + h0 - o));
        pattern.push_back(V2d(x0 + o, y0 + o));
    }

    int passes = depth_passes(depth, state.material.stepdown);
    PathWriter w(state, out);
    const V2d& start = pattern.front();
    w.begin(start.x, start.y);
    for(int k = 1; k <= passes; k++) {
        double z = -pass_depth(depth, k, passes);
        w.plunge(z);
        for(size_t i = 1; i < pattern.size(); i++) w.cut(pattern[i].x, pattern[i].y);
        if(k < passes) {
            w.rapid_z(z + state.config.clearance);
            w.rapid(start.x, start.y, z + state.config.clearance);
        }
    }
    w.retract();
}

void comment(Toolpath& out, const std::string& text) {
    Segment s(SegmentType::COMMENT);
    s.text = text;
    out.push(s);
}

void dwell(Toolpath& out, double seconds) {
    if(seconds < 0.) throw RuntimeError("dwell time must not be negative");
    Segment s(SegmentType::DWELL);
    s.seconds = seconds;
    out.push(s);
}

Value linspace(const Number& start, const Number& stop, const Number& count, size_t max_count) {
    if(start.is_length() != stop.is_length()) {
        throw TypeError(std::string("linspace() start and stop must both be lengths or both unitless, got ") +
                        (start.is_length() ? "length" : "unitless number") + " and " +
                        (stop.is_length() ? "length" : "unitless number"));
    }
    if(!count.is_integral() || count.value < 1.) {
        throw RuntimeError("linspace() count must be an integer of at least 1, got " + count.str());
    }
    if(count.value > static_cast<double>(max_count)) {
        throw RuntimeError("linspace() count " + count.str() + " exceeds the limit of " + std::to_string(max_count));
    }
    size_t n = static_cast<size_t>(count.value);
    Unit unit = start.is_length() ? CANONICAL_UNIT : Unit::NONE;
    double a = start.canonical();
    double b = stop.canonical();

    std::vector<Value> items;
    items.reserve(n);
    for(size_t i = 0; i < n; i++) {
        double v = a;
        if(i + 1 == n && n > 1) v = b;
        else if(i > 0) v = a + (b - a) * static_cast<double>(i) / static_cast<double>(n - 1);
        items.push_back(Value(Number(v, unit)));
    }
    return Value::sequence(std::move(items));
}

} // namespace gcad
