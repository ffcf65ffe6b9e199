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
#include "engine/value.h"

#include <map>
#include <string>
#include <vector>

namespace gcad {

// Nested lexical scopes. Frames live in one arena and point at their
// parent; lookups walk outwards, assignments always go to the innermost.
class ScopeStack {
public:
    ScopeStack();

    void push();
    void pop();
    size_t depth() const { return frames.size(); }

    void bind(const std::string& name, const Value& value);
    // nullptr when unbound
    const Value* lookup(const std::string& name) const;

private:
    struct Frame {
        std::map<std::string, Value> vars;
        int parent;
    };
    std::vector<Frame> frames;
};

// Pushes a frame for the lifetime of the guard.
class ScopeGuard {
public:
    explicit ScopeGuard(ScopeStack& scopes) : scopes(scopes) { scopes.push(); }
    ~ScopeGuard() { scopes.pop(); }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    ScopeStack& scopes;
};

} // namespace gcad
