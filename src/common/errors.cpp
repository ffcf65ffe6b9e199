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
#include "common/errors.h"

namespace gcad {

const char* error_kind_name(ErrorKind kind) {
    switch(kind) {
    case ErrorKind::SYNTAX: return "SyntaxError";
    case ErrorKind::NAME: return "NameError";
    case ErrorKind::TYPE: return "TypeError";
    case ErrorKind::BINDING: return "BindingError";
    case ErrorKind::CONFIG: return "ConfigError";
    case ErrorKind::RUNTIME: return "RuntimeError";
    }
    return "Error";
}

Error::Error(ErrorKind kind, const std::string& message, SourceLocation loc)
    : std::runtime_error(message), kind_(kind), message_(message), loc_(loc)
{
    render();
}

void Error::locate(SourceLocation loc) {
    if(loc_.valid()) return;
    loc_ = loc;
    render();
}

void Error::render() {
    full_ = error_kind_name(kind_);
    if(loc_.valid()) {
        full_ += " at " + std::to_string(loc_.line) + ":" + std::to_string(loc_.column);
    }
    full_ += ": " + message_;
}

} // namespace gcad
