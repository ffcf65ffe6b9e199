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
#include "engine/scope.h"

#include <stdexcept>

namespace gcad {

ScopeStack::ScopeStack() {
    frames.push_back(Frame{{}, -1});
}

void ScopeStack::push() {
    frames.push_back(Frame{{}, static_cast<int>(frames.size()) - 1});
}

void ScopeStack::pop() {
    if(frames.size() == 1) throw std::logic_error("cannot pop the global scope");
    frames.pop_back();
}

void ScopeStack::bind(const std::string& name, const Value& value) {
    frames.back().vars[name] = value;
}

const Value* ScopeStack::lookup(const std::string& name) const {
    for(int k = static_cast<int>(frames.size()) - 1; k >= 0; k = frames[k].parent) {
        auto it = frames[k].vars.find(name);
        if(it != frames[k].vars.end()) return &it->second;
    }
    return nullptr;
}

} // namespace gcad
