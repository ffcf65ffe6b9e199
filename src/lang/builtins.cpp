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
#include "lang/builtins.h"

namespace gcad {

const char* param_kind_name(ParamKind kind) {
    switch(kind) {
    case ParamKind::LENGTH: return "length";
    case ParamKind::NUMBER: return "unitless number";
    case ParamKind::ANY_NUMBER: return "number";
    case ParamKind::STRING: return "string";
    }
    return "?";
}

const std::vector<BuiltinSpec>& builtin_catalog() {
    constexpr ParamKind L = ParamKind::LENGTH;
    constexpr ParamKind N = ParamKind::NUMBER;
    constexpr ParamKind A = ParamKind::ANY_NUMBER;
    constexpr ParamKind S = ParamKind::STRING;
    static const std::vector<BuiltinSpec> catalog = {
        {Builtin::CUTTER_DIAMETER, "cutter_diameter", {{"diameter", L, true}}},
        {Builtin::MATERIAL, "material", {{"name", S, true}}},
        {Builtin::DEFINE_MATERIAL, "define_material", {
            {"name", S, true},
            {"stepover", N, true},
            {"stepdown", L, true},
            {"feed_rate", N, true},
            {"plunge_rate", N, true},
            {"rpm", N, true}}},
        {Builtin::RPM, "rpm", {{"rpm", N, true}}},
        {Builtin::SCALE, "scale", {{"x", N, true}, {"y", N, true}}},
        {Builtin::COMMENT, "comment", {{"text", S, true}}},
        {Builtin::DWELL, "dwell", {{"seconds", N, true}}},
        {Builtin::DRILL, "drill", {
            {"x", L, true},
            {"y", L, true},
            {"depth", L, true},
            {"peck", L, false}}},
        {Builtin::CIRCLE_POCKET, "circle_pocket", {
            {"x", L, true},
            {"y", L, true},
            {"radius", L, false},
            {"depth", L, true},
            {"diameter", L, false}}},
        {Builtin::GROOVE, "groove", {
            {"x1", L, true},
            {"y1", L, true},
            {"x2", L, false},
            {"y2", L, false},
            {"depth", L, true},
            {"cx", L, false},
            {"cy", L, false},
            {"up", L, false}}},
        {Builtin::GROOVE_POCKET, "groove_pocket", {
            {"x", L, true},
            {"y", L, true},
            {"width", L, true},
            {"height", L, true},
            {"depth", L, true}}},
        {Builtin::LINSPACE, "linspace", {
            {"start", A, true},
            {"stop", A, true},
            {"count", N, true}}},
    };
    return catalog;
}

const BuiltinSpec* find_builtin(const std::string& name) {
    for(const auto& spec : builtin_catalog()) {
        if(name == spec.name) return &spec;
    }
    return nullptr;
}

} // namespace gcad
