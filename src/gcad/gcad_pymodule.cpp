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
#include <pybind11/pybind11.h>
#include "gcad/compiler.h"

#include <stdint.h>
// Get ssize_t defined
#if defined(_MSC_VER)
#include <BaseTsd.h>
typedef SSIZE_T ssize_t;
#endif

namespace py = pybind11;

PYBIND11_MODULE(gcadlib, m) {
    m.doc() = "gcad script to G-code compiler";

    py::register_exception<gcad::Error>(m, "CompileError");

    py::class_<gcad::MachineConfig>(m, "MachineConfig")
        .def(py::init<>())
        .def_readwrite("safe_height", &gcad::MachineConfig::safe_height)
        .def_readwrite("clearance", &gcad::MachineConfig::clearance)
        .def_readwrite("peck_depth", &gcad::MachineConfig::peck_depth)
        .def_readwrite("cutter_diameter", &gcad::MachineConfig::cutter_diameter)
        .def_readwrite("material", &gcad::MachineConfig::material)
        .def_readwrite("precision", &gcad::MachineConfig::precision);

    m.def("compile", [](const std::string& source, const gcad::MachineConfig& config) {
        return gcad::compile(source, config);
    }, py::arg("source"), py::arg("config") = gcad::MachineConfig());

    // Rows of (x, y, z, feed, segment type, source line), one per motion.
    py::class_<gcad::Compiler>(m, "Compiler", py::buffer_protocol())
        .def(py::init<const gcad::MachineConfig&>(), py::arg("config") = gcad::MachineConfig())
        .def("run", &gcad::Compiler::run, py::arg("source"), py::arg("name") = "<string>")
        .def("run_file", &gcad::Compiler::run_file)
        .def("output", &gcad::Compiler::output)
        .def_readwrite("verbose", &gcad::Compiler::verbose)
        .def_buffer([](gcad::Compiler& c) -> py::buffer_info {
            std::vector<double>& points = c.points();
            constexpr size_t elements = gcad::POINT_STRIDE;
            ssize_t shape[] = {(ssize_t)(points.size() / elements), (ssize_t)elements};
            return py::buffer_info(
                 (void*)points.data(),
                 sizeof(double),
                 py::format_descriptor<double>::format(),
                 2,
                 shape,
                 {sizeof(double) * elements, sizeof(double)},
                 true
             );
        });
}
