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
#include "gcad/compiler.h"
#include "common/errors.h"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " -o OUTPUT [-v] [-m PROFILE] [--safe-height MM] [--clearance MM]"
                 " [--peck MM] [--precision N] INPUT" << std::endl;
}

bool parse_double(const char* text, double& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

} // namespace

int main(int argc, char* argv[]) {
    gcad::MachineConfig config;
    std::string input, output, profile;
    bool verbose = false;

    for(int k = 1; k < argc; k++) {
        std::string arg = argv[k];
        // options below all take a value
        bool has_value = k + 1 < argc;
        if(arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if(arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if((arg == "-o" || arg == "--output") && has_value) {
            output = argv[++k];
        } else if((arg == "-m" || arg == "--materials") && has_value) {
            profile = argv[++k];
        } else if((arg == "--safe-height" || arg == "--clearance" || arg == "--peck") && has_value) {
            double v;
            if(!parse_double(argv[++k], v) || !(v > 0.)) {
                std::cerr << "error: " << arg << " needs a positive number of mm" << std::endl;
                return 2;
            }
            if(arg == "--safe-height") config.safe_height = v;
            else if(arg == "--clearance") config.clearance = v;
            else config.peck_depth = v;
        } else if(arg == "--precision" && has_value) {
            double v;
            if(!parse_double(argv[++k], v) || v < 0. || v > 9. || v != static_cast<int>(v)) {
                std::cerr << "error: --precision needs an integer from 0 to 9" << std::endl;
                return 2;
            }
            config.precision = static_cast<int>(v);
        } else if(!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown or incomplete option '" << arg << "'" << std::endl;
            usage(argv[0]);
            return 2;
        } else if(input.empty()) {
            input = arg;
        } else {
            std::cerr << "error: more than one input file" << std::endl;
            usage(argv[0]);
            return 2;
        }
    }
    if(input.empty() || output.empty()) {
        usage(argv[0]);
        return 2;
    }

    std::string current;
    std::string gcode;
    try {
        gcad::Compiler compiler(config);
        compiler.verbose = verbose;
        if(!profile.empty()) {
            current = profile;
            compiler.run_file(profile);
        }
        current = input;
        compiler.run_file(input);
        gcode = compiler.output();
    } catch(const gcad::Error& e) {
        std::cerr << "error: " << (current.empty() ? input : current) << ": " << e.what() << std::endl;
        return 1;
    }

    std::ofstream fp(output);
    fp << gcode;
    if(!fp.good()) {
        std::cerr << "error: cannot write '" << output << "'" << std::endl;
        return 1;
    }
    if(verbose) std::cout << "wrote " << output << std::endl;
    return 0;
}
