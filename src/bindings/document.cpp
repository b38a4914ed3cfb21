// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "bindings.h"

using namespace pdfgraph;

static ObjectPairs pairs_from_dict(py::dict d)
{
    ObjectPairs pairs;
    for (auto item : d) {
        pairs.emplace_back(item.first.cast<std::string>(), item.second.cast<Object>());
    }
    return pairs;
}

void init_document(py::module_ &m)
{
    py::class_<OpenOptions>(m, "OpenOptions")
        .def(py::init<>())
        .def_readwrite("password", &OpenOptions::password)
        .def_readwrite("hex_password", &OpenOptions::hex_password)
        .def_readwrite("ignore_xref_streams", &OpenOptions::ignore_xref_streams)
        .def_readwrite("suppress_warnings", &OpenOptions::suppress_warnings)
        .def_readwrite("attempt_recovery", &OpenOptions::attempt_recovery)
        .def_readwrite("inherit_page_attributes", &OpenOptions::inherit_page_attributes)
        .def_readwrite("description", &OpenOptions::description);

    py::enum_<EncryptionMethod>(m, "EncryptionMethod")
        .value("none", EncryptionMethod::None)
        .value("unknown", EncryptionMethod::Unknown)
        .value("rc4", EncryptionMethod::RC4)
        .value("aes", EncryptionMethod::AES)
        .value("aesv3", EncryptionMethod::AESv3);

    py::class_<EncryptionInfo>(m, "EncryptionInfo")
        .def_readonly("R", &EncryptionInfo::R)
        .def_readonly("P", &EncryptionInfo::P)
        .def_readonly("V", &EncryptionInfo::V)
        .def_readonly("stream_method", &EncryptionInfo::stream_method)
        .def_readonly("string_method", &EncryptionInfo::string_method)
        .def_readonly("file_method", &EncryptionInfo::file_method)
        .def_property_readonly("user_password",
            [](EncryptionInfo const &info) { return py::bytes(info.user_password); })
        .def_property_readonly("encryption_key",
            [](EncryptionInfo const &info) { return py::bytes(info.encryption_key); });

    py::class_<Permissions>(m, "Permissions")
        .def(py::init<>())
        .def_readwrite("accessibility", &Permissions::accessibility)
        .def_readwrite("extract", &Permissions::extract)
        .def_readwrite("modify_annotation", &Permissions::modify_annotation)
        .def_readwrite("modify_assembly", &Permissions::modify_assembly)
        .def_readwrite("modify_form", &Permissions::modify_form)
        .def_readwrite("modify_other", &Permissions::modify_other)
        .def_readwrite("print_lowres", &Permissions::print_lowres)
        .def_readwrite("print_highres", &Permissions::print_highres);

    py::class_<Document>(m, "Document")
        .def_static("empty", &Document::empty)
        .def_static(
            "open",
            [](py::object filename, OpenOptions const &options) {
                return Document::open(fspath(filename), options);
            },
            py::arg("filename"),
            py::arg("options") = OpenOptions())
        .def_static(
            "open_memory",
            [](py::bytes data, OpenOptions const &options) {
                return Document::open_memory(std::string(data), options);
            },
            py::arg("data"),
            py::arg("options") = OpenOptions())
        .def_property_readonly("filename", &Document::filename)
        .def_property_readonly("pdf_version", &Document::pdf_version)
        .def_property_readonly("extension_level", &Document::extension_level)
        .def_property_readonly("is_encrypted", &Document::is_encrypted)
        .def_property_readonly("encryption_info", &Document::encryption_info)
        .def_property_readonly("allow", &Document::permissions)
        .def_property_readonly("user_password_matched", &Document::user_password_matched)
        .def_property_readonly("owner_password_matched", &Document::owner_password_matched)
        .def_property_readonly("is_linearized", &Document::is_linearized)
        .def("check_linearization", &Document::check_linearization)
        .def("get_warnings", &Document::get_warnings)
        .def_property_readonly("trailer", &Document::get_trailer)
        .def_property_readonly("root", &Document::get_root)
        .def("get_object",
            &Document::get_object_by_id,
            py::arg("id"),
            py::arg("generation") = 0)
        .def_property_readonly("objects", &Document::get_all_objects)
        .def("parse_object",
            &Document::parse_object,
            py::arg("text"),
            py::arg("description") = "")
        .def("new_null", &Document::new_null)
        .def("new_bool", &Document::new_bool)
        .def("new_integer", &Document::new_integer)
        .def("new_real",
            py::overload_cast<double, int>(&Document::new_real, py::const_),
            py::arg("value"),
            py::arg("places") = 0)
        .def("new_real",
            py::overload_cast<std::string const &>(&Document::new_real, py::const_))
        .def("new_name", &Document::new_name)
        .def("new_string", &Document::new_utf8_string, "String from text, stored as PDF text.")
        .def("new_binary_string",
            [](Document const &doc, py::bytes data) {
                return doc.new_binary_string(std::string(data));
            })
        .def("new_array", &Document::new_array, py::arg("items") = std::vector<Object>())
        .def(
            "new_dictionary",
            [](Document const &doc, py::dict d) {
                return doc.new_dictionary_from(pairs_from_dict(d));
            },
            py::arg("items") = py::dict())
        .def(
            "new_stream",
            [](Document const &doc, py::bytes data, py::dict d) {
                if (d.empty())
                    return doc.new_stream(std::string(data));
                return doc.new_stream_with_dictionary(pairs_from_dict(d), std::string(data));
            },
            py::arg("data")       = py::bytes(),
            py::arg("dictionary") = py::dict())
        .def("new_operator", &Document::new_operator)
        .def("new_reserved", &Document::new_reserved)
        .def("copy_foreign", &Document::copy_foreign)
        .def("replace_object", &Document::replace_object)
        .def("swap_objects", &Document::swap_objects)
        .def("replace_reserved", &Document::replace_reserved)
        .def_property_readonly("pages", &Document::pages)
        .def("add_page", &Document::add_page, py::arg("page"), py::arg("first") = false)
        .def("remove_page", &Document::remove_page)
        .def("close", &Document::close)
        .def("__enter__", [](Document &doc) { return doc; })
        .def("__exit__",
            [](Document &doc, py::object, py::object, py::object) { doc.close(); })
        .def(
            "__eq__",
            [](Document const &a, Document const &b) { return a == b; },
            py::is_operator())
        .def("__repr__", [](Document const &doc) {
            return std::string("<pdfgraph.Document description='") + doc.filename() +
                   "'>";
        });
}

void init_pagelist(py::module_ &m)
{
    py::class_<PageList>(m, "PageList")
        .def("__len__", &PageList::count)
        .def("__getitem__",
            [](PageList const &pl, py::ssize_t index) {
                auto uindex = uindex_from_index(pl.count(), index);
                auto page   = pl.get_page(uindex);
                if (!page)
                    throw py::index_error("page index out of range");
                return std::move(*page);
            })
        .def("__setitem__",
            [](PageList &pl, py::ssize_t index, Object const &page) {
                pl.set_page(uindex_from_index(pl.count(), index), page);
            })
        .def("__delitem__",
            [](PageList &pl, py::ssize_t index) {
                pl.delete_page(uindex_from_index(pl.count(), index));
            })
        .def("__iter__",
            [](PageList const &pl) { return py::iter(py::cast(pl.get_pages())); })
        .def(
            "insert",
            [](PageList &pl, py::ssize_t index, Object const &page) {
                // Inserting at len(pages) appends, so only negatives are adjusted
                if (index < 0)
                    index += static_cast<py::ssize_t>(pl.count());
                if (index < 0)
                    throw py::index_error("page index out of range");
                pl.insert_page(static_cast<size_t>(index), page);
            },
            py::arg("index"),
            py::arg("obj"))
        .def("append", &PageList::append_page, py::arg("page"))
        .def("remove", &PageList::remove_page, py::arg("page"))
        .def(
            "index",
            [](PageList const &pl, Object const &page) {
                auto index = pl.index_of(page);
                if (!index)
                    throw py::value_error("page is not in this document");
                return *index;
            },
            py::arg("page"));
}
