// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "bindings.h"

using namespace pdfgraph;

void init_writer(py::module_ &m)
{
    py::enum_<StreamDataMode>(m, "StreamDataMode")
        .value("uncompress", StreamDataMode::Uncompress)
        .value("preserve", StreamDataMode::Preserve)
        .value("compress", StreamDataMode::Compress);

    py::enum_<ObjectStreamMode>(m, "ObjectStreamMode")
        .value("disable", ObjectStreamMode::Disable)
        .value("preserve", ObjectStreamMode::Preserve)
        .value("generate", ObjectStreamMode::Generate);

    py::class_<Encryption>(m, "Encryption")
        .def(py::init<>())
        .def_readwrite("owner", &Encryption::owner)
        .def_readwrite("user", &Encryption::user)
        .def_readwrite("R", &Encryption::R)
        .def_readwrite("allow", &Encryption::allow)
        .def_readwrite("aes", &Encryption::aes)
        .def_readwrite("metadata", &Encryption::metadata);

    py::class_<WriterConfig>(m, "WriterConfig")
        .def(py::init<>())
        .def_readwrite("pdf_version", &WriterConfig::pdf_version)
        .def_readwrite("extension_level", &WriterConfig::extension_level)
        .def_readwrite("min_version", &WriterConfig::min_version)
        .def_readwrite("linearize", &WriterConfig::linearize)
        .def_readwrite("static_id", &WriterConfig::static_id)
        .def_readwrite("deterministic_id", &WriterConfig::deterministic_id)
        .def_readwrite("compress_streams", &WriterConfig::compress_streams)
        .def_readwrite("stream_data_mode", &WriterConfig::stream_data_mode)
        .def_readwrite("decode_level", &WriterConfig::decode_level)
        .def_readwrite("object_stream_mode", &WriterConfig::object_stream_mode)
        .def_readwrite("content_normalization", &WriterConfig::content_normalization)
        .def_readwrite(
            "preserve_unreferenced_objects", &WriterConfig::preserve_unreferenced_objects)
        .def_readwrite("qdf", &WriterConfig::qdf)
        .def_readwrite("newline_before_endstream", &WriterConfig::newline_before_endstream)
        .def_readwrite("recompress_flate", &WriterConfig::recompress_flate)
        .def_readwrite("preserve_encryption", &WriterConfig::preserve_encryption)
        .def_readwrite("encryption", &WriterConfig::encryption)
        .def_readwrite("progress", &WriterConfig::progress);

    py::class_<Writer>(m, "Writer")
        .def(py::init<Document, WriterConfig>(),
            py::arg("document"),
            py::arg("config") = WriterConfig())
        .def("write_to_memory", [](Writer &w) { return py::bytes(w.write_to_memory()); })
        .def(
            "write",
            [](Writer &w, py::object filename) { w.write(fspath(filename)); },
            py::arg("filename"));
}
