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
#include "common/errors.h"

#include <cmath>
#include <functional>
#include <iostream>
#include <string>

namespace gcad {

// Checks shared by the test executables. A failed check is reported on
// std::cerr and counted; main() returns the count.
inline int& test_failures() {
    static int failures = 0;
    return failures;
}

template <typename A, typename B>
void EXPECT_EQ(const A& a, const B& b, const std::string& what = "") {
    if(!(a == b)) {
        std::cerr << "mismatch " << what << ": " << a << " vs " << b << std::endl;
        test_failures()++;
    }
}

inline void EXPECT_NEAR(double a, double b, double tolerance, const std::string& what = "") {
    if(!(std::fabs(a - b) <= tolerance)) {
        std::cerr << "mismatch " << what << ": " << a << " vs " << b << std::endl;
        test_failures()++;
    }
}

inline void EXPECT_TRUE(bool condition, const std::string& what) {
    if(!condition) {
        std::cerr << "failed " << what << std::endl;
        test_failures()++;
    }
}

// Runs f and expects a gcad::Error of the given kind. Returns what() of the
// error caught, empty when there was none.
inline std::string EXPECT_ERROR(ErrorKind kind, const std::function<void()>& f, const std::string& what) {
    try {
        f();
    } catch(const Error& e) {
        if(e.kind() != kind) {
            std::cerr << "wrong error " << what << ": expected " << error_kind_name(kind) << ", got " << e.what()
                      << std::endl;
            test_failures()++;
        }
        return e.what();
    }
    std::cerr << "no error " << what << ": expected " << error_kind_name(kind) << std::endl;
    test_failures()++;
    return "";
}

} // namespace gcad
