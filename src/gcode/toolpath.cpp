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
#include "gcode/toolpath.h"

namespace gcad {

std::vector<double> Toolpath::points() const {
    std::vector<double> pts;
    pts.reserve(segments_.size() * POINT_STRIDE);
    for(const auto& s : segments_) {
        if(s.type != SegmentType::RAPID && s.type != SegmentType::LINEAR && s.type != SegmentType::ARC_CCW) continue;
        pts.push_back(s.target.x);
        pts.push_back(s.target.y);
        pts.push_back(s.target.z);
        pts.push_back(s.feed);
        pts.push_back(static_cast<double>(s.type));
        pts.push_back(static_cast<double>(s.line));
    }
    return pts;
}

} // namespace gcad
