// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <string>
#include <utility>

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "pdfgraph.h"

namespace py = pybind11;

// Python-style index: negative values count from the end
inline size_t uindex_from_index(size_t size, py::ssize_t index)
{
    if (index < 0)
        index += static_cast<py::ssize_t>(size);
    if (index < 0 || static_cast<size_t>(index) >= size)
        throw py::index_error("index out of range");
    return static_cast<size_t>(index);
}

// Filesystem path from a str, bytes or os.PathLike, encoded the way the OS
// expects it
std::string fspath(py::object filename);

void init_logger(py::module_ &m);
void init_object(py::module_ &m);
void init_views(py::module_ &m);
void init_namepath(py::module_ &m);
void init_document(py::module_ &m);
void init_pagelist(py::module_ &m);
void init_writer(py::module_ &m);
void init_parsers(py::module_ &m);
