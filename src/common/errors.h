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
#include <stdexcept>
#include <string>

namespace gcad {

enum class ErrorKind {
    SYNTAX,
    NAME,
    TYPE,
    BINDING,
    CONFIG,
    RUNTIME
};

const char* error_kind_name(ErrorKind kind);

struct SourceLocation {
    int line = 0;
    int column = 0;

    SourceLocation() {}
    SourceLocation(int line, int column) : line(line), column(column) {}

    bool valid() const { return line > 0; }
};

// Every compile error. The first one thrown aborts the whole compilation.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, SourceLocation loc = SourceLocation());

    ErrorKind kind() const { return kind_; }
    const SourceLocation& location() const { return loc_; }
    const std::string& message() const { return message_; }

    // Errors raised below the evaluator don't know where they happened; the
    // evaluator fills the location in on the way out.
    void locate(SourceLocation loc);

    const char* what() const noexcept override { return full_.c_str(); }

private:
    void render();

    ErrorKind kind_;
    std::string message_;
    SourceLocation loc_;
    std::string full_;
};

struct SyntaxError : Error {
    SyntaxError(const std::string& msg, SourceLocation loc) : Error(ErrorKind::SYNTAX, msg, loc) {}
};

struct NameError : Error {
    explicit NameError(const std::string& msg, SourceLocation loc = SourceLocation())
        : Error(ErrorKind::NAME, msg, loc) {}
};

struct TypeError : Error {
    explicit TypeError(const std::string& msg, SourceLocation loc = SourceLocation())
        : Error(ErrorKind::TYPE, msg, loc) {}
};

struct BindingError : Error {
    explicit BindingError(const std::string& msg, SourceLocation loc = SourceLocation())
        : Error(ErrorKind::BINDING, msg, loc) {}
};

struct ConfigError : Error {
    explicit ConfigError(const std::string& msg, SourceLocation loc = SourceLocation())
        : Error(ErrorKind::CONFIG, msg, loc) {}
};

struct RuntimeError : Error {
    explicit RuntimeError(const std::string& msg, SourceLocation loc = SourceLocation())
        : Error(ErrorKind::RUNTIME, msg, loc) {}
};

} // namespace gcad
