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
#include <string>
#include <vector>

namespace gcad {

// Every function a script can call. Call targets are resolved to one of
// these when the AST is built, never looked up by name at run time.
enum class Builtin {
    CUTTER_DIAMETER,
    MATERIAL,
    DEFINE_MATERIAL,
    RPM,
    SCALE,
    COMMENT,
    DWELL,
    DRILL,
    CIRCLE_POCKET,
    GROOVE,
    GROOVE_POCKET,
    LINSPACE
};

enum class ParamKind {
    LENGTH,      // number with a unit
    NUMBER,      // unitless number
    ANY_NUMBER,
    STRING
};

const char* param_kind_name(ParamKind kind);

struct ParamSpec {
    const char* name;
    ParamKind kind;
    bool required;
};

struct BuiltinSpec {
    Builtin id;
    const char* name;
    std::vector<ParamSpec> params;
};

const std::vector<BuiltinSpec>& builtin_catalog();
// nullptr when no builtin has that name
const BuiltinSpec* find_builtin(const std::string& name);

} // namespace gcad
