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
#include "engine/scope.h"
#include "common/expect.h"

#include <algorithm>
#include <cmath>

using namespace gcad;

// Runs a script on a fresh state and returns the evaluator's toolpath.
struct Session {
    MachineState state;
    Toolpath path;
    Evaluator evaluator;

    Session() : evaluator(state, path) {}

    void run(const std::string& source) {
        evaluator.run(*build_ast(*parse(source)));
    }
    const Value& var(const std::string& name) {
        static const Value none;
        const Value* v = evaluator.scopes().lookup(name);
        return v ? *v : none;
    }
};

static double deepest(const Toolpath& path) {
    double z = 0.;
    for(const auto& s : path.segments()) {
        if(s.type == SegmentType::LINEAR || s.type == SegmentType::ARC_CCW) z = std::min(z, s.target.z);
    }
    return z;
}

void testScopes() {
    ScopeStack scopes;
    scopes.bind("a", Value(Number(1.)));
    {
        ScopeGuard guard(scopes);
        EXPECT_EQ(scopes.depth(), size_t(2), "pushed");
        EXPECT_TRUE(scopes.lookup("a") != nullptr, "outer visible");
        scopes.bind("a", Value(Number(2.)));
        EXPECT_EQ(scopes.lookup("a")->number.value, 2., "shadowed");
        scopes.bind("b", Value(Number(3.)));
    }
    EXPECT_EQ(scopes.depth(), size_t(1), "popped");
    EXPECT_EQ(scopes.lookup("a")->number.value, 1., "outer restored");
    EXPECT_TRUE(scopes.lookup("b") == nullptr, "inner gone");
}

void testExpressions() {
    Session s;
    s.run("a = 1in + 4.6mm; b = 2 * 3cm; c = -2^2; d = 2^3^2; e = 3! + 1; f = g = 4;");
    EXPECT_NEAR(s.var("a").number.value, 30., 1e-9, "a");
    EXPECT_TRUE(s.var("a").number.unit == Unit::MM, "a canonical");
    EXPECT_TRUE(s.var("b").number.unit == Unit::CM && s.var("b").number.value == 6., "b keeps unit");
    EXPECT_EQ(s.var("c").number.value, -4., "c");
    EXPECT_EQ(s.var("d").number.value, 512., "d");
    EXPECT_EQ(s.var("e").number.value, 7., "e");
    EXPECT_EQ(s.var("g").number.value, 4., "chained assignment");
    EXPECT_EQ(s.var("f").number.value, 4., "assignment value");

    std::string what = EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("x = 1 + 1mm;"); }, "mixed add");
    EXPECT_TRUE(what.find("1:7") != std::string::npos, "operator located: " + what);
    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("x = 'a' * 2;"); }, "string operand");
    EXPECT_ERROR(ErrorKind::NAME, [] { Session().run("x = y;"); }, "undefined variable");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("x = 1 / 0;"); }, "divide by zero");
}

void testBlockScoping() {
    Session s;
    s.run("a = 1; { a = 2; b = 3; } for i in linspace(1, 3, 3) { c = i; }");
    EXPECT_EQ(s.var("a").number.value, 1., "block assignment shadows");
    EXPECT_TRUE(s.var("b").is_none(), "block variable gone");
    EXPECT_TRUE(s.var("i").is_none(), "loop variable gone");
    EXPECT_TRUE(s.var("c").is_none(), "loop body variable gone");

    Session t;
    t.run("n = 0; for i in linspace(1, 4, 4) { m = n + i; }");
    EXPECT_EQ(t.var("n").number.value, 0., "outer untouched");

    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("for i in 3 { }"); }, "loop over number");

    // rebinding the loop variable only lasts for that iteration
    Session r;
    r.run("for y in linspace(0mm, 10mm, 3) { y = y + 100mm; drill(0mm, y, 1mm); }");
    std::vector<double> holes;
    for(const auto& seg : r.path.segments()) {
        if(seg.type == SegmentType::LINEAR) holes.push_back(seg.target.y);
    }
    EXPECT_EQ(holes.size(), size_t(3), "one plunge per hole");
    if(holes.size() == 3) {
        EXPECT_EQ(holes[0], 100., "first hole");
        EXPECT_EQ(holes[1], 105., "second hole");
        EXPECT_EQ(holes[2], 110., "third hole");
    }
}

void testLinspace() {
    Value v = linspace(Number(0., Unit::MM), Number(1., Unit::CM), Number(3.), 100);
    EXPECT_EQ(v.items.size(), size_t(3), "count");
    EXPECT_EQ(v.items[0].number.value, 0., "first");
    EXPECT_EQ(v.items[1].number.value, 5., "middle");
    EXPECT_EQ(v.items[2].number.value, 10., "last is stop");
    EXPECT_TRUE(v.items[2].number.unit == Unit::MM, "canonical");

    Value one = linspace(Number(7.), Number(9.), Number(1.), 100);
    EXPECT_EQ(one.items.size(), size_t(1), "single");
    EXPECT_EQ(one.items[0].number.value, 7., "single is start");

    Value flat = linspace(Number(2.), Number(2.), Number(4.), 100);
    EXPECT_EQ(flat.items[3].number.value, 2., "constant");

    EXPECT_ERROR(ErrorKind::RUNTIME, [] { linspace(Number(0.), Number(1.), Number(0.), 100); }, "count 0");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { linspace(Number(0.), Number(1.), Number(2.5), 100); }, "count 2.5");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { linspace(Number(0.), Number(1.), Number(101.), 100); }, "over limit");
    EXPECT_ERROR(ErrorKind::TYPE, [] { linspace(Number(0.), Number(1., Unit::MM), Number(2.), 100); }, "mixed");
}

void testMaterials() {
    MachineState state;
    EXPECT_EQ(state.material.name, "default", "starts on default");
    EXPECT_EQ(state.rpm, 12000., "default rpm");
    state.select_material("wood");
    EXPECT_EQ(state.material.stepdown, 2., "wood stepdown");
    EXPECT_EQ(state.rpm, 16000., "wood rpm");

    std::string what = EXPECT_ERROR(ErrorKind::CONFIG, [&] { state.select_material("UNOBTAINIUM"); }, "unknown");
    EXPECT_TRUE(what.find("UNOBTAINIUM") != std::string::npos, "names material: " + what);
    EXPECT_EQ(state.material.name, "wood", "selection unchanged");

    Session s;
    s.run("define_material('foam', 0.5, 10mm, 3000, 1000, 8000); material('foam'); rpm(9000);");
    EXPECT_EQ(s.state.material.name, "foam", "custom material");
    EXPECT_EQ(s.state.material.stepdown, 10., "custom stepdown");
    EXPECT_EQ(s.state.rpm, 9000., "rpm override");
    s.run("define_material('foam', 0.5, 5mm, 3000, 1000, 8000);");
    EXPECT_EQ(s.state.material.stepdown, 5., "redefinition applies");

    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("define_material('x', 2, 1mm, 1, 1, 1);"); }, "stepover");
    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("material(3);"); }, "material needs string");
}

void testDepthPasses() {
    EXPECT_EQ(depth_passes(3., 1.), 3, "exact");
    EXPECT_EQ(depth_passes(3.1, 1.), 4, "remainder");
    EXPECT_EQ(depth_passes(.5, 1.), 1, "shallow");
    EXPECT_EQ(pass_depth(5., 3, 3), 5., "last pass exact");
    EXPECT_NEAR(pass_depth(5., 1, 3), 5. / 3., 1e-12, "first pass");
    EXPECT_EQ(step_count("stepover", 0., 1.), 1, "at least one");
    EXPECT_EQ(step_count("stepover", double(MAX_STEPS), 1.), MAX_STEPS, "at the cap");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { step_count("stepdown", 1e10, 2.); }, "past int range");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { step_count("stepdown", MAX_STEPS + 1., 1.); }, "over the cap");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { step_count("stepdown", std::nan(""), 1.); }, "nan");
}

void testDrill() {
    Session s;
    s.run("drill(1mm, 2mm, 5mm);");
    std::vector<double> plunges;
    for(const auto& seg : s.path.segments()) {
        if(seg.type == SegmentType::LINEAR) plunges.push_back(seg.target.z);
    }
    EXPECT_EQ(plunges.size(), size_t(3), "three pecks of at most 2mm");
    for(size_t k = 1; k < plunges.size(); k++) {
        EXPECT_TRUE(plunges[k] < plunges[k - 1], "pecks deepen");
        EXPECT_TRUE(plunges[k - 1] - plunges[k] <= 2. + 1e-9, "peck bounded");
    }
    EXPECT_EQ(plunges.back(), -5., "full depth");
    const Segment& first = s.path[0];
    EXPECT_TRUE(first.type == SegmentType::RAPID && first.target == V3d(1., 2., 5.), "rapid to safe height");
    EXPECT_EQ(s.path.segments().back().target.z, 5., "ends at safe height");

    Session p;
    p.run("drill(0mm, 0mm, 4mm, peck=1mm);");
    int pecks = 0;
    for(const auto& seg : p.path.segments()) pecks += seg.type == SegmentType::LINEAR;
    EXPECT_EQ(pecks, 4, "explicit peck");

    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("drill(1, 2mm, 3mm);"); }, "unitless x");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("drill(1mm, 2mm, -3mm);"); }, "negative depth");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("drill(0mm, 0mm, 10000000000mm);"); }, "too many pecks");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("drill(10^307 * 1yd, 0mm, 1mm);"); }, "mm overflow");
    EXPECT_ERROR(ErrorKind::RUNTIME,
                 [] { Session().run("scale(10^200, 10^200); drill(10^200 * 1mm, 0mm, 1mm);"); }, "scaled overflow");
}

void testCirclePocket() {
    Session s;
    s.run("circle_pocket(10mm, 10mm, radius=5mm, depth=3mm);");
    EXPECT_EQ(deepest(s.path), -3., "reaches depth");
    double centre_step = 0.;
    int arcs = 0;
    for(const auto& seg : s.path.segments()) {
        if(seg.type != SegmentType::ARC_CCW) continue;
        arcs++;
        EXPECT_TRUE(seg.center == V2d(10., 10.), "arc centre");
        double r = std::fabs(seg.target.x - 10.);
        EXPECT_TRUE(r <= 5. - 3.175 / 2. + 1e-9, "tool stays inside");
        if(arcs == 2) centre_step = r;
    }
    EXPECT_TRUE(arcs > 0 && arcs % 2 == 0, "full circles");
    EXPECT_TRUE(centre_step <= .4 * 3.175 + 1e-9, "stepover bounded");

    Session d;
    d.run("circle_pocket(0mm, 0mm, depth=1mm, diameter=10mm);");
    EXPECT_EQ(deepest(d.path), -1., "diameter form");

    EXPECT_ERROR(ErrorKind::BINDING, [] { Session().run("circle_pocket(0mm, 0mm, depth=1mm);"); }, "no size");
    EXPECT_ERROR(ErrorKind::BINDING,
                 [] { Session().run("circle_pocket(0mm, 0mm, 5mm, 1mm, diameter=10mm);"); }, "both sizes");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("circle_pocket(0mm, 0mm, 1mm, 1mm);"); }, "too small");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("circle_pocket(0mm, 0mm, 1000000m, 1mm);"); }, "too many rings");
    EXPECT_ERROR(ErrorKind::RUNTIME,
                 [] { Session().run("scale(2, 1); circle_pocket(0mm, 0mm, 5mm, 1mm);"); }, "non uniform arcs");
}

void testGrooves() {
    Session s;
    s.run("material('wood'); groove(0mm, 0mm, 20mm, 0mm, 5mm);");
    std::vector<double> xs;
    for(const auto& seg : s.path.segments()) {
        if(seg.type == SegmentType::LINEAR && seg.target.x != (xs.empty() ? 0. : xs.back())) xs.push_back(seg.target.x);
    }
    EXPECT_EQ(deepest(s.path), -5., "groove depth");
    EXPECT_TRUE(xs.size() >= 2 && xs[0] == 20. && xs[1] == 0., "alternating passes");

    Session a;
    a.run("groove(10mm, 0mm, 0mm, 10mm, 1mm, cx=0mm, cy=0mm);");
    bool arc = false;
    for(const auto& seg : a.path.segments()) arc = arc || seg.type == SegmentType::ARC_CCW;
    EXPECT_TRUE(arc, "arc groove");
    EXPECT_ERROR(ErrorKind::RUNTIME,
                 [] { Session().run("groove(10mm, 0mm, 0mm, 5mm, 1mm, cx=0mm, cy=0mm);"); }, "unequal radii");
    EXPECT_ERROR(ErrorKind::BINDING, [] { Session().run("groove(1mm, 0mm, 0mm, 1mm, 1mm, cx=0mm);"); }, "cx only");

    // arc passes lift clear of the surface before crossing back
    Session lift;
    lift.run("material('wood'); groove(10mm, 0mm, 0mm, 10mm, 5mm, cx=0mm, cy=0mm);");
    for(const auto& seg : lift.path.segments()) {
        if(seg.type != SegmentType::RAPID) continue;
        EXPECT_TRUE(seg.target.z == 5. || seg.target.z == .25, "rapids above the surface");
    }

    Session up;
    up.run("groove(2mm, 3mm, depth=1mm, up=10mm);");
    bool reached = false;
    for(const auto& seg : up.path.segments()) {
        if(seg.type == SegmentType::LINEAR && seg.target == V3d(2., 13., -1.)) reached = true;
    }
    EXPECT_TRUE(reached, "up cuts along +y");
    EXPECT_ERROR(ErrorKind::BINDING, [] { Session().run("groove(0mm, 0mm, 5mm, 5mm, 1mm, up=2mm);"); }, "end and up");
    EXPECT_ERROR(ErrorKind::BINDING, [] { Session().run("groove(0mm, 0mm, depth=1mm);"); }, "no end");
    EXPECT_ERROR(ErrorKind::BINDING, [] { Session().run("groove(0mm, 0mm, 5mm, depth=1mm);"); }, "x2 only");
    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("groove(0mm, 0mm, depth=1mm, up=2);"); }, "unitless up");

    Session p;
    p.run("groove_pocket(0mm, 0mm, 20mm, 10mm, 2mm);");
    for(const auto& seg : p.path.segments()) {
        if(seg.type != SegmentType::LINEAR) continue;
        EXPECT_TRUE(seg.target.x >= 3.175 / 2. - 1e-9 && seg.target.x <= 20. - 3.175 / 2. + 1e-9, "inside x");
        EXPECT_TRUE(seg.target.y >= 3.175 / 2. - 1e-9 && seg.target.y <= 10. - 3.175 / 2. + 1e-9, "inside y");
    }
    EXPECT_EQ(deepest(p.path), -2., "pocket depth");
}

void testStateDirectives() {
    Session s;
    s.run("cutter_diameter(6mm); comment('start'); dwell(1.5); drill(0mm, 0mm, 1mm);");
    EXPECT_EQ(s.state.cutter_diameter, 6., "cutter");
    EXPECT_TRUE(s.path[0].type == SegmentType::COMMENT && s.path[0].text == "start", "comment first");
    EXPECT_TRUE(s.path[1].type == SegmentType::DWELL && s.path[1].seconds == 1.5, "dwell");
    bool announced = false;
    for(const auto& seg : s.path.segments()) {
        if(seg.type == SegmentType::TOOL_CHANGE) announced = seg.text == "6mm cutter, default";
    }
    EXPECT_TRUE(announced, "tool announced");
    EXPECT_EQ(s.path[0].line, 1, "line stamped");

    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("cutter_diameter(0mm);"); }, "zero cutter");
    EXPECT_ERROR(ErrorKind::TYPE, [] { Session().run("cutter_diameter(3);"); }, "unitless cutter");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { Session().run("dwell(-1);"); }, "negative dwell");

    Session k;
    k.run("scale(2, 2); drill(1mm, 1mm, 1mm);");
    EXPECT_TRUE(k.path[0].target == V3d(2., 2., 5.), "scaled");
}

int main() {
    testScopes();
    testExpressions();
    testBlockScoping();
    testLinspace();
    testMaterials();
    testDepthPasses();
    testDrill();
    testCirclePocket();
    testGrooves();
    testStateDirectives();
    return test_failures();
}
