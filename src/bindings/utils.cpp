// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "bindings.h"

/* Convert a Python object to a filesystem encoded path
 * Use Python's os.fspath() which accepts os.PathLike (str, bytes, pathlib.Path),
 * then encode str in the filesystem encoding. bytes are taken as they are.
 */
std::string fspath(py::object filename)
{
    py::handle handle = PyOS_FSPath(filename.ptr());
    if (!handle)
        throw py::error_already_set();
    auto path = py::reinterpret_steal<py::object>(handle);
    if (py::isinstance<py::str>(path)) {
        auto encoded =
            py::reinterpret_steal<py::object>(PyUnicode_EncodeFSDefault(path.ptr()));
        if (!encoded)
            throw py::error_already_set();
        return encoded.cast<std::string>();
    }
    return path.cast<std::string>();
}
