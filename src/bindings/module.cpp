// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <cerrno>

#include <qpdf/QUtil.hh>

#include "bindings.h"

using namespace pdfgraph;

// Pipeline to relay qpdf log messages to Python logging module
void init_logger(py::module_ &m)
{
    // Never freed: qpdf's default logger can outlive the interpreter
    auto *py_logger = new py::object(
        py::module_::import("logging").attr("getLogger")("pdfgraph._pdfgraph"));

    set_log_handler([py_logger](LogLevel level, std::string const &msg) {
        py::gil_scoped_acquire gil;
        const char *method = "info";
        if (level == LogLevel::Warning)
            method = "warning";
        else if (level == LogLevel::Error)
            method = "error";
        py_logger->attr(method)(msg);
    });
    get_pdfgraph_logger()->info("pdfgraph C++ to Python logger bridge initialized\n");
}

PYBIND11_MODULE(_pdfgraph, m)
{
    m.doc()            = "pdfgraph: typed handles onto the object graph of a PDF";
    m.attr("__name__") = "pdfgraph._pdfgraph";
    m.def("qpdf_version", &qpdf_version, "Get libqpdf version");

    // -- Core objects --
    init_logger(m);
    init_object(m);
    init_views(m);
    init_namepath(m);
    init_document(m);
    init_pagelist(m);
    init_writer(m);
    init_parsers(m);

    auto m_test = m.def_submodule("_test", "pdfgraph._pdfgraph test functions");
    m_test
        .def(
            "fopen_nonexistent_file",
            []() -> void {
                translate_errors([] { (void)QUtil::safe_fopen("does_not_exist__42", "rb"); });
            },
            "Used to test that C++ system error -> Python exception propagation works.")
        .def(
            "log_info",
            [](std::string s) { return get_pdfgraph_logger()->info(s); },
            "Used to test routing of qpdf's logger to Python logging.");

    // -- Module level functions --
    m.def("utf8_to_pdf_doc",
         [](std::string const &utf8, char unknown) {
             auto result = utf8_to_pdf_doc(utf8, unknown);
             return py::make_tuple(result.first, py::bytes(result.second));
         },
         py::arg("utf8"),
         py::arg("unknown") = '?')
        .def("pdf_doc_to_utf8",
            [](py::bytes pdfdoc) -> py::str { return py::str(pdf_doc_to_utf8(std::string(pdfdoc))); })
        .def(
            "_rewrite_qpdf_logic_error_msg",
            &rewrite_qpdf_logic_error_msg,
            "Used to test interpretation of qpdf errors.")
        .def("set_flate_compression_level", &set_flate_compression_level)
        .def("equivalent", &pdfgraph::equivalent, "Compare two objects by value.");

    // -- Exceptions --
    // clang-format off
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_main;
    exc_main.call_once_and_store_result(
        [&]() { return py::exception<PdfError>(m, "PdfError"); });
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_password;
    exc_password.call_once_and_store_result(
        [&]() { return py::exception<PasswordError>(m, "PasswordError", exc_main.get_stored()); });
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_datadecoding;
    exc_datadecoding.call_once_and_store_result(
        [&]() { return py::exception<DataDecodingError>(m, "DataDecodingError", exc_main.get_stored()); });
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_parse;
    exc_parse.call_once_and_store_result(
        [&]() { return py::exception<ParseError>(m, "ParseError", exc_main.get_stored()); });
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_foreign;
    exc_foreign.call_once_and_store_result(
        [&]() { return py::exception<ForeignObjectError>(m, "ForeignObjectError", exc_main.get_stored()); });
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> exc_typemismatch;
    exc_typemismatch.call_once_and_store_result(
        [&]() { return py::exception<TypeMismatchError>(m, "TypeMismatchError", PyExc_TypeError); });
    // clang-format on
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const PasswordError &e) {
            py::set_error(exc_password.get_stored(), e.what());
        } catch (const DataDecodingError &e) {
            py::set_error(exc_datadecoding.get_stored(), e.what());
        } catch (const ParseError &e) {
            py::set_error(exc_parse.get_stored(), e.what());
        } catch (const ForeignObjectError &e) {
            py::set_error(exc_foreign.get_stored(), e.what());
        } catch (const TypeMismatchError &e) {
            py::set_error(exc_typemismatch.get_stored(), e.what());
        } catch (const IOError &e) {
            if (e.error_number() != 0) {
                errno = e.error_number();
                PyErr_SetFromErrno(PyExc_OSError);
            } else {
                py::set_error(PyExc_OSError, e.what());
            }
        } catch (const PdfError &e) {
            py::set_error(exc_main.get_stored(), e.what());
        }
    });

    // clang-format off
#if defined(VERSION_INFO)
    m.attr("__version__") = VERSION_INFO;
#else
    m.attr("__version__") = "dev";
#endif
    // clang-format on
}
