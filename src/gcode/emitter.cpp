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
#include "gcode/emitter.h"
#include "common/errors.h"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace gcad {

Emitter::Emitter(int precision, double safe_height)
    : precision(precision), safe_height(safe_height)
{}

void Emitter::reset() {
    motion_mode = -1;
    modal.clear();
    position = V3d();
    position_known = false;
}

std::string Emitter::format(double value) const {
    if(!std::isfinite(value)) throw RuntimeError("cannot write a non-finite number");
    std::ostringstream o;
    o << std::fixed << std::setprecision(precision) << value;
    std::string s = o.str();
    if(s.find('.') != std::string::npos) {
        while(s.back() == '0') s.pop_back();
        if(s.back() == '.') s.pop_back();
    }
    if(s == "-0") s = "0";
    return s;
}

void Emitter::word(std::string& line, char letter, double value, bool always) {
    std::string v = format(value);
    auto it = modal.find(letter);
    if(!always && it != modal.end() && it->second == v) return;
    modal[letter] = v;
    line += ' ';
    line += letter;
    line += v;
}

void Emitter::comment(std::ostream& o, const std::string& text) {
    std::istringstream lines(text);
    std::string l;
    bool any = false;
    while(std::getline(lines, l)) {
        if(!l.empty() && l.back() == '\r') l.pop_back();
        o << (l.empty() ? ";" : "; " + l) << "\n";
        any = true;
    }
    if(!any) o << ";\n";
}

void Emitter::motion(std::ostream& o, const Segment& s) {
    int code = 0;
    if(s.type == SegmentType::LINEAR) code = 1;
    else if(s.type == SegmentType::ARC_CCW) code = 3;

    std::string words;
    if(code == 3) {
        if(!position_known) throw RuntimeError("arc move without a known start position");
        word(words, 'X', s.target.x, true);
        word(words, 'Y', s.target.y, true);
        word(words, 'Z', s.target.z);
        words += " I" + format(s.center.x - position.x);
        words += " J" + format(s.center.y - position.y);
    } else {
        word(words, 'X', s.target.x);
        word(words, 'Y', s.target.y);
        word(words, 'Z', s.target.z);
    }
    position = s.target;
    position_known = true;
    // the tool would not move
    if(words.empty()) return;

    if(code != 0) word(words, 'F', s.feed);
    if(code != motion_mode) {
        o << "G" << code << words << "\n";
        motion_mode = code;
    } else {
        o << words.substr(1) << "\n";
    }
}

void Emitter::write(std::ostream& o, const Toolpath& path) {
    reset();
    o << "G90\n";
    o << "G21\n";
    // XY of the tool is unknown here, only Z is commanded
    std::string z;
    word(z, 'Z', safe_height);
    o << "G0" << z << "\n";
    motion_mode = 0;
    o << "M05\n";
    for(const auto& s : path.segments()) {
        switch(s.type) {
        case SegmentType::RAPID:
        case SegmentType::LINEAR:
        case SegmentType::ARC_CCW:
            motion(o, s);
            break;
        case SegmentType::DWELL:
            o << "G4 P" << format(s.seconds) << "\n";
            break;
        case SegmentType::COMMENT:
            comment(o, s.text);
            break;
        case SegmentType::TOOL_CHANGE:
            comment(o, "tool: " + s.text);
            break;
        case SegmentType::SPINDLE:
            if(s.rpm > 0.) o << "M03 S" << format(s.rpm) << "\n";
            else o << "M05\n";
            break;
        }
    }
    o << "M05\n";
    o << "M02\n";
}

std::string emit(const Toolpath& path, int precision, double safe_height) {
    std::ostringstream o;
    Emitter emitter(precision, safe_height);
    emitter.write(o, path);
    return o.str();
}

} // namespace gcad
