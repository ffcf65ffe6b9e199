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
#include "engine/value.h"

#include <ostream>

namespace gcad {

Value Value::string(const std::string& s) {
    Value v;
    v.kind = Kind::STRING;
    v.text = s;
    return v;
}

Value Value::sequence(std::vector<Value> items) {
    Value v;
    v.kind = Kind::SEQUENCE;
    v.items = std::move(items);
    return v;
}

const char* Value::kind_name() const {
    switch(kind) {
    case Kind::NONE: return "none";
    case Kind::NUMBER: return number.is_length() ? "length" : "unitless number";
    case Kind::STRING: return "string";
    case Kind::SEQUENCE: return "sequence";
    }
    return "?";
}

std::string Value::str() const {
    switch(kind) {
    case Kind::NONE: return "none";
    case Kind::NUMBER: return number.str();
    case Kind::STRING: return "'" + text + "'";
    case Kind::SEQUENCE: {
        std::string s = "[";
        for(size_t i = 0; i < items.size(); i++) {
            if(i) s += ", ";
            s += items[i].str();
        }
        return s + "]";
    }
    }
    return "?";
}

std::ostream& operator<<(std::ostream& o, const Value& v) {
    o << v.str();
    return o;
}

} // namespace gcad
