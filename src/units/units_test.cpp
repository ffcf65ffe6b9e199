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
#include "common/expect.h"

using namespace gcad;

void testConversion() {
    Unit u;
    EXPECT_TRUE(parse_unit("in", u) && u == Unit::IN, "parse in");
    EXPECT_TRUE(!parse_unit("furlong", u), "reject furlong");
    EXPECT_TRUE(!parse_unit("", u), "reject empty");

    EXPECT_NEAR(Number(1., Unit::IN).canonical(), 25.4, 1e-12, "1in");
    EXPECT_NEAR(Number(2., Unit::CM).canonical(), 20., 1e-12, "2cm");
    EXPECT_NEAR(Number(1., Unit::FT).canonical(), 304.8, 1e-12, "1ft");
    EXPECT_NEAR(Number(1., Unit::YD).canonical(), 914.4, 1e-12, "1yd");
    EXPECT_NEAR(Number(.5, Unit::M).canonical(), 500., 1e-12, ".5m");
    EXPECT_NEAR(Number(7.).canonical(), 7., 0., "unitless passes through");

    Number back = Number(50.8, Unit::MM).convert(Unit::IN);
    EXPECT_NEAR(back.value, 2., 1e-12, "mm to in");
    EXPECT_TRUE(back.unit == Unit::IN, "converted unit");

    const Unit all[] = {Unit::MM, Unit::CM, Unit::M, Unit::IN, Unit::FT, Unit::YD};
    for(Unit from : all) {
        for(Unit to : all) {
            double v = 3.7;
            double expected = v * unit_factor(from) / unit_factor(to);
            EXPECT_NEAR(from_canonical(to_canonical(v, from), to), expected, 1e-9 * expected,
                        std::string(unit_name(from)) + " to " + unit_name(to));
        }
    }
}

void testArithmetic() {
    Number sum = add(Number(1., Unit::IN), Number(4.6, Unit::MM));
    EXPECT_NEAR(sum.value, 30., 1e-9, "1in + 4.6mm");
    EXPECT_TRUE(sum.unit == CANONICAL_UNIT, "sum is canonical");

    Number diff = subtract(Number(1., Unit::CM), Number(2., Unit::MM));
    EXPECT_NEAR(diff.value, 8., 1e-9, "1cm - 2mm");

    EXPECT_NEAR(add(Number(2.), Number(3.)).value, 5., 0., "unitless add");
    EXPECT_TRUE(!add(Number(2.), Number(3.)).is_length(), "unitless stays unitless");

    Number scaled = multiply(Number(2.), Number(3., Unit::IN));
    EXPECT_NEAR(scaled.value, 6., 0., "2 * 3in");
    EXPECT_TRUE(scaled.unit == Unit::IN, "scaled keeps unit");

    Number half = divide(Number(10., Unit::MM), Number(4.));
    EXPECT_NEAR(half.value, 2.5, 0., "10mm / 4");

    EXPECT_NEAR(power(Number(2.), Number(10.)).value, 1024., 0., "2^10");
    EXPECT_NEAR(power(Number(2.), Number(-1.)).value, .5, 0., "2^-1");
    EXPECT_NEAR(negate(Number(3., Unit::CM)).value, -3., 0., "negate");
    EXPECT_TRUE(negate(Number(3., Unit::CM)).unit == Unit::CM, "negate keeps unit");

    EXPECT_NEAR(factorial(Number(0.)).value, 1., 0., "0!");
    EXPECT_NEAR(factorial(Number(5.)).value, 120., 0., "5!");
}

void testArithmeticErrors() {
    EXPECT_ERROR(ErrorKind::TYPE, [] { add(Number(1.), Number(1., Unit::MM)); }, "unitless + length");
    EXPECT_ERROR(ErrorKind::TYPE, [] { subtract(Number(1., Unit::MM), Number(1.)); }, "length - unitless");
    EXPECT_ERROR(ErrorKind::TYPE, [] { multiply(Number(1., Unit::MM), Number(1., Unit::MM)); }, "area");
    EXPECT_ERROR(ErrorKind::TYPE, [] { divide(Number(1., Unit::MM), Number(1., Unit::MM)); }, "length / length");
    EXPECT_ERROR(ErrorKind::TYPE, [] { divide(Number(1.), Number(1., Unit::MM)); }, "unitless / length");
    EXPECT_ERROR(ErrorKind::TYPE, [] { power(Number(2., Unit::MM), Number(2.)); }, "length ^ n");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { divide(Number(1.), Number(0.)); }, "division by zero");
    EXPECT_ERROR(ErrorKind::TYPE, [] { factorial(Number(3., Unit::MM)); }, "length!");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { factorial(Number(-1.)); }, "negative!");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { factorial(Number(2.5)); }, "fractional!");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { factorial(Number(171.)); }, "171!");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { multiply(Number(1e200), Number(1e200)); }, "product overflow");
    EXPECT_ERROR(ErrorKind::RUNTIME,
                 [] { add(Number(1e308, Unit::MM), Number(1e308, Unit::MM)); }, "sum overflow");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { divide(Number(1e300), Number(1e-300)); }, "quotient overflow");
    EXPECT_ERROR(ErrorKind::RUNTIME, [] { power(Number(10.), Number(400.)); }, "power overflow");
}

int main() {
    testConversion();
    testArithmetic();
    testArithmeticErrors();
    return test_failures();
}
