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

namespace gcad {

// Lengths are normalised to millimetres before any arithmetic.
enum class Unit {NONE, MM, CM, M, IN, FT, YD};

constexpr Unit CANONICAL_UNIT = Unit::MM;

// mm per unit. NONE maps to 1 so unitless values pass through.
double unit_factor(Unit unit);
const char* unit_name(Unit unit);
// Returns false when `text` is not one of mm|cm|m|in|ft|yd.
bool parse_unit(const std::string& text, Unit& unit);

double to_canonical(double value, Unit unit);
double from_canonical(double value, Unit unit);

// A magnitude with an optional length unit.
struct Number {
    double value = 0.;
    Unit unit = Unit::NONE;

    Number() {}
    Number(double value, Unit unit = Unit::NONE) : value(value), unit(unit) {}

    bool is_length() const { return unit != Unit::NONE; }
    bool is_integral() const;
    double canonical() const { return to_canonical(value, unit); }
    Number convert(Unit to) const;
    std::string str() const;
};

Number add(const Number& a, const Number& b);
Number subtract(const Number& a, const Number& b);
Number multiply(const Number& a, const Number& b);
Number divide(const Number& a, const Number& b);
Number power(const Number& a, const Number& b);
Number negate(const Number& a);
Number factorial(const Number& a);

} // namespace gcad
