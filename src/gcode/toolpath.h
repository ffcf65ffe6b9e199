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
#include "common/vec.h"

#include <string>
#include <vector>

namespace gcad {

enum class SegmentType {
    RAPID,          // G0
    LINEAR,         // G1
    ARC_CCW,        // G3, XY plane
    DWELL,          // G4
    COMMENT,
    SPINDLE,        // M03 / M05
    TOOL_CHANGE     // tool/material marker
};

// One atomic motion or state directive. Coordinates are absolute, in mm.
struct Segment {
    SegmentType type;
    V3d target;
    V2d center;     // ARC_CCW only
    double feed = 0.;
    double rpm = 0.;
    double seconds = 0.;
    std::string text;
    int line = 0;   // source line of the statement that produced it

    explicit Segment(SegmentType type) : type(type) {}
};

// Ordered instruction buffer. Segments are appended in program order and
// never reordered.
class Toolpath {
public:
    void push(Segment segment) {
        segment.line = line;
        segments_.push_back(std::move(segment));
    }

    // Drops segments past the first `n`.
    void truncate(size_t n) {
        if(n < segments_.size()) segments_.erase(segments_.begin() + n, segments_.end());
    }

    // Source line stamped on segments pushed from now on.
    void set_line(int l) { line = l; }

    const std::vector<Segment>& segments() const { return segments_; }
    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }
    const Segment& operator[](size_t k) const { return segments_[k]; }

    // Motion segments flattened to rows of (x, y, z, feed, type, line).
    std::vector<double> points() const;

private:
    std::vector<Segment> segments_;
    int line = 0;
};

constexpr size_t POINT_STRIDE = 6;

} // namespace gcad
