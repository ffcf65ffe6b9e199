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
#include "gcode/toolpath.h"

#include <iosfwd>
#include <map>
#include <string>

namespace gcad {

// Serialises a toolpath into G-code. Words that would not change the modal
// state of the controller (motion mode, coordinates, feed) are left out.
// The prologue lifts the tool straight up to `safe_height` and stops the
// spindle before any XY traverse.
class Emitter {
public:
    explicit Emitter(int precision = 3, double safe_height = 5.);

    void write(std::ostream& o, const Toolpath& path);

    // Fixed precision, trailing zeros trimmed, never "-0".
    std::string format(double value) const;

private:
    void reset();
    void motion(std::ostream& o, const Segment& s);
    void comment(std::ostream& o, const std::string& text);
    // Appends `letter value` to line when it differs from the modal value.
    void word(std::string& line, char letter, double value, bool always = false);

    int precision;
    double safe_height;
    int motion_mode = -1;
    std::map<char, std::string> modal;   // last emitted X, Y, Z, F
    V3d position;
    bool position_known = false;
};

std::string emit(const Toolpath& path, int precision = 3, double safe_height = 5.);

} // namespace gcad
