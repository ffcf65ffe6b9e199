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
#include "units/units.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace gcad {

// Runtime datum produced by expression evaluation.
struct Value {
    enum class Kind {NONE, NUMBER, STRING, SEQUENCE};

    Kind kind = Kind::NONE;
    Number number;
    std::string text;
    std::vector<Value> items;

    Value() {}
    Value(const Number& n) : kind(Kind::NUMBER), number(n) {}

    static Value string(const std::string& s);
    static Value sequence(std::vector<Value> items);

    bool is_none() const { return kind == Kind::NONE; }
    bool is_number() const { return kind == Kind::NUMBER; }
    bool is_string() const { return kind == Kind::STRING; }
    bool is_sequence() const { return kind == Kind::SEQUENCE; }

    // "length", "unitless number", "string", ...; used in error messages.
    const char* kind_name() const;
    std::string str() const;
};

std::ostream& operator<<(std::ostream& o, const Value& v);

} // namespace gcad
