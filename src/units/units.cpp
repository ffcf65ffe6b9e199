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
#include "units/units.h"
#include "common/errors.h"

#include <cmath>
#include <sstream>

namespace gcad {

struct UnitSpec {
    Unit unit;
    const char* name;
    double mm; // exact multiplier to millimetres
};

constexpr UnitSpec units[] = {
    {Unit::MM, "mm", 1.},
    {Unit::CM, "cm", 10.},
    {Unit::M, "m", 1000.},
    {Unit::IN, "in", 25.4},
    {Unit::FT, "ft", 304.8},
    {Unit::YD, "yd", 914.4},
};

double unit_factor(Unit unit) {
    for(const auto& spec : units) {
        if(spec.unit == unit) return spec.mm;
    }
    return 1.;
}

const char* unit_name(Unit unit) {
    for(const auto& spec : units) {
        if(spec.unit == unit) return spec.name;
    }
    return "";
}

bool parse_unit(const std::string& text, Unit& unit) {
    for(const auto& spec : units) {
        if(text == spec.name) {
            unit = spec.unit;
            return true;
        }
    }
    return false;
}

double to_canonical(double value, Unit unit) {
    return value * unit_factor(unit);
}

double from_canonical(double value, Unit unit) {
    return value / unit_factor(unit);
}

bool Number::is_integral() const {
    return std::isfinite(value) && std::floor(value) == value;
}

Number Number::convert(Unit to) const {
    if(unit == Unit::NONE || to == Unit::NONE) return *this;
    return Number(from_canonical(canonical(), to), to);
}

std::string Number::str() const {
    std::ostringstream o;
    o << value << unit_name(unit);
    return o.str();
}

static const char* kind(const Number& n) {
    return n.is_length() ? "length" : "unitless number";
}

static TypeError operand_error(const char* op, const Number& a, const Number& b) {
    return TypeError(std::string("unsupported operands for '") + op + "': " + kind(a) + " and " + kind(b));
}

// Results that overflow a double are errors, never inf in the output.
static Number finite(const char* op, const Number& a, const Number& b, const Number& result) {
    if(!std::isfinite(result.value)) {
        throw RuntimeError("result of " + a.str() + " " + op + " " + b.str() + " is out of range");
    }
    return result;
}

static Number additive(const char* op, const Number& a, const Number& b, double sign) {
    if(a.is_length() != b.is_length()) throw operand_error(op, a, b);
    if(!a.is_length()) return finite(op, a, b, Number(a.value + sign * b.value));
    return finite(op, a, b, Number(a.canonical() + sign * b.canonical(), CANONICAL_UNIT));
}

Number add(const Number& a, const Number& b) {
    return additive("+", a, b, 1.);
}

Number subtract(const Number& a, const Number& b) {
    return additive("-", a, b, -1.);
}

Number multiply(const Number& a, const Number& b) {
    // no area units
    if(a.is_length() && b.is_length()) throw operand_error("*", a, b);
    Unit unit = a.is_length() ? a.unit : b.unit;
    return finite("*", a, b, Number(a.value * b.value, unit));
}

Number divide(const Number& a, const Number& b) {
    if(b.is_length()) throw operand_error("/", a, b);
    if(b.value == 0.) throw RuntimeError("division by zero");
    return finite("/", a, b, Number(a.value / b.value, a.unit));
}

Number power(const Number& a, const Number& b) {
    if(a.is_length() || b.is_length()) throw operand_error("^", a, b);
    return finite("^", a, b, Number(std::pow(a.value, b.value)));
}

Number negate(const Number& a) {
    return Number(-a.value, a.unit);
}

Number factorial(const Number& a) {
    if(a.is_length()) throw TypeError("unsupported operand for '!': length");
    if(!a.is_integral() || a.value < 0.) {
        throw RuntimeError("factorial needs a non-negative integer, got " + a.str());
    }
    if(a.value > 170.) throw RuntimeError("factorial of " + a.str() + " overflows");
    double result = 1.;
    for(int k = 2; k <= static_cast<int>(a.value); k++) result *= k;
    return Number(result);
}

} // namespace gcad
