// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "bindings.h"

using namespace pdfgraph;

void init_object(py::module_ &m)
{
    py::enum_<ObjectType>(m, "ObjectType")
        .value("uninitialized", ObjectType::Uninitialized)
        .value("reserved", ObjectType::Reserved)
        .value("null", ObjectType::Null)
        .value("boolean", ObjectType::Boolean)
        .value("integer", ObjectType::Integer)
        .value("real", ObjectType::Real)
        .value("string", ObjectType::String)
        .value("name", ObjectType::Name)
        .value("array", ObjectType::Array)
        .value("dictionary", ObjectType::Dictionary)
        .value("stream", ObjectType::Stream)
        .value("operator", ObjectType::Operator)
        .value("inline_image", ObjectType::InlineImage);

    py::enum_<DecodeLevel>(m, "StreamDecodeLevel")
        .value("none", DecodeLevel::None)
        .value("generalized", DecodeLevel::Generalized)
        .value("specialized", DecodeLevel::Specialized)
        .value("all", DecodeLevel::All);

    py::class_<Object>(m, "Object")
        .def_property_readonly("type", &Object::get_type)
        .def_property_readonly("type_name", [](Object const &h) { return h.type_name(); })
        .def_property_readonly("is_initialized", &Object::is_initialized)
        .def_property_readonly("is_reserved", &Object::is_reserved)
        .def_property_readonly("is_null", &Object::is_null)
        .def_property_readonly("is_bool", &Object::is_bool)
        .def_property_readonly("is_integer", &Object::is_integer)
        .def_property_readonly("is_real", &Object::is_real)
        .def_property_readonly("is_number", &Object::is_number)
        .def_property_readonly("is_string", &Object::is_string)
        .def_property_readonly("is_name", &Object::is_name)
        .def_property_readonly("is_array", &Object::is_array)
        .def_property_readonly("is_dictionary", &Object::is_dictionary)
        .def_property_readonly("is_stream", &Object::is_stream)
        .def_property_readonly("is_operator", &Object::is_operator)
        .def_property_readonly("is_inline_image", &Object::is_inline_image)
        .def_property_readonly("is_scalar", &Object::is_scalar)
        .def_property_readonly("is_indirect", &Object::is_indirect)
        .def_property_readonly("is_page", &Object::is_page)
        .def_property_readonly("objgen",
            [](Object const &h) {
                return std::make_pair(h.get_id(), h.get_generation());
            },
            "Object and generation number; (0, 0) for direct objects.")
        .def("make_indirect", &Object::make_indirect)
        .def("as_bool", &Object::as_bool)
        .def("as_int", &Object::as_i64)
        .def("as_real", &Object::as_real, "Decimal text of a real or integer.")
        .def("as_number", &Object::as_number)
        .def("as_name", &Object::as_name)
        .def("as_str", &Object::as_string, "Text of a string, decoded to UTF-8.")
        .def("as_bytes",
            [](Object const &h) { return py::bytes(h.as_binary_string()); })
        .def("as_operator", &Object::as_operator)
        .def("as_inline_image",
            [](Object const &h) { return py::bytes(h.as_inline_image()); })
        .def("unparse",
            [](Object const &h, bool binary) -> py::object {
                if (binary)
                    return py::bytes(h.to_binary());
                return py::str(h.to_string());
            },
            py::arg("binary") = false)
        .def("to_json", &Object::to_json, py::arg("dereference") = false)
        .def("get_page_content_data",
            [](Object const &h) { return py::bytes(h.get_page_content_data()); })
        .def("get_path", &Object::get_path)
        .def_property_readonly("owner", &Object::owner)
        .def("same_owner_as", &Object::same_owner_as)
        .def("equivalent", &pdfgraph::equivalent)
        .def(
            "__eq__",
            [](Object const &a, Object const &b) { return a == b; },
            py::is_operator())
        .def(
            "__ne__",
            [](Object const &a, Object const &b) { return a != b; },
            py::is_operator())
        .def(
            "__lt__",
            [](Object const &a, Object const &b) { return a < b; },
            py::is_operator())
        .def("__repr__", &pdfgraph::repr)
        .def("__str__", [](Object const &h) { return h.to_string(); });
}

void init_views(py::module_ &m)
{
    py::class_<Array>(m, "Array")
        .def(py::init<Object const &>())
        .def("__len__", &Array::size)
        .def("__getitem__",
            [](Array const &a, py::ssize_t index) {
                auto uindex = uindex_from_index(a.size(), index);
                auto item   = a.get(uindex);
                if (!item)
                    throw py::index_error("index out of range");
                return std::move(*item);
            })
        .def("__setitem__",
            [](Array &a, py::ssize_t index, Object const &value) {
                a.set(uindex_from_index(a.size(), index), value);
            })
        .def("__delitem__",
            [](Array &a, py::ssize_t index) {
                a.erase(uindex_from_index(a.size(), index));
            })
        .def("append", &Array::push)
        .def("insert", &Array::insert)
        .def("items", &Array::items)
        .def("__iter__", [](Array const &a) { return py::iter(py::cast(a.items())); })
        .def_property_readonly("obj", &Array::object);

    py::class_<Dictionary>(m, "Dictionary")
        .def(py::init<Object const &>())
        .def("__len__", &Dictionary::size)
        .def("__contains__", &Dictionary::has)
        .def("keys", &Dictionary::keys)
        .def("get", &Dictionary::get)
        .def("__getitem__",
            [](Dictionary const &d, std::string const &key) {
                auto value = d.get(key);
                if (!value)
                    throw py::key_error(key);
                return std::move(*value);
            })
        .def("__setitem__", &Dictionary::set)
        .def("__delitem__",
            [](Dictionary &d, std::string const &key) {
                if (!d.has(key))
                    throw py::key_error(key);
                d.remove(key);
            })
        .def("items", &Dictionary::items)
        .def("__iter__", [](Dictionary const &d) { return py::iter(py::cast(d.keys())); })
        .def_property_readonly("obj", &Dictionary::object);

    py::class_<Stream>(m, "Stream")
        .def(py::init<Object const &>())
        .def_property_readonly("stream_dict", &Stream::get_stream_dictionary)
        .def(
            "read_bytes",
            [](Stream const &s, DecodeLevel level) {
                return py::bytes(s.get_stream_data(level));
            },
            py::arg("decode_level") = DecodeLevel::Generalized)
        .def("read_raw_bytes",
            [](Stream const &s) { return py::bytes(s.get_raw_stream_data()); })
        .def(
            "write",
            [](Stream &s,
                py::bytes data,
                std::optional<Object> filter,
                std::optional<Object> decode_parms) {
                if (filter.has_value() != decode_parms.has_value())
                    throw py::value_error("filter and decode_parms go together");
                if (filter)
                    s.replace_stream_data(std::string(data), *filter, *decode_parms);
                else
                    s.replace_stream_data(std::string(data));
            },
            py::arg("data"),
            py::arg("filter")       = py::none(),
            py::arg("decode_parms") = py::none())
        .def_property_readonly("obj", &Stream::object);
}

void init_namepath(py::module_ &m)
{
    py::class_<NamePath>(m, "NamePath")
        .def(py::init<>())
        .def(py::init([](py::args args) {
            std::vector<NamePath::Step> steps;
            for (auto const &arg : args) {
                if (py::isinstance<py::str>(arg))
                    steps.emplace_back(arg.cast<std::string>());
                else if (py::isinstance<py::int_>(arg))
                    steps.emplace_back(arg.cast<int>());
                else if (py::isinstance<Object>(arg) &&
                         arg.cast<Object const &>().is_name())
                    steps.emplace_back(arg.cast<Object const &>().as_name());
                else
                    throw py::type_error("NamePath components must be str, int, or Name");
            }
            return NamePath(std::move(steps));
        }))
        .def("join",
            [](NamePath const &p, py::object step) {
                if (py::isinstance<py::int_>(step))
                    return p.join(step.cast<int>());
                return p.join(step.cast<std::string>());
            })
        .def("__repr__", &NamePath::to_string)
        .def("__len__", &NamePath::depth)
        .def("__bool__", [](NamePath const &p) { return !p.is_root(); })
        // path[0] appends an index
        .def("__getitem__", [](NamePath const &p, int index) { return p.join(index); })
        // path.Resources appends a name
        .def("__getattr__", [](NamePath const &p, std::string const &name) {
            if (name.empty() || name[0] == '_')
                throw py::attribute_error(name);
            return p.join(name);
        });
}
