// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <locale>
#include <sstream>

#include "bindings.h"

using namespace pdfgraph;

void init_parsers(py::module_ &m)
{
    py::class_<ContentStreamInstruction>(m, "ContentStreamInstruction")
        .def(py::init<ObjectList, Object>(), py::arg("operands"), py::arg("operator"))
        .def_property_readonly(
            "operator",
            &ContentStreamInstruction::op,
            "The operator of used in this instruction.")
        .def_property_readonly(
            "operands",
            &ContentStreamInstruction::operands,
            "The operands (parameters) supplied to the operator.")
        .def("__len__", [](ContentStreamInstruction const &) { return 2; })
        .def("__repr__", [](ContentStreamInstruction const &csi) {
            std::ostringstream ss;
            ss.imbue(std::locale::classic());
            ss << "pdfgraph.ContentStreamInstruction([";
            const char *delim = "";
            for (auto const &operand : csi.operands()) {
                ss << delim << pdfgraph::repr(operand);
                delim = ", ";
            }
            ss << "], " << pdfgraph::repr(csi.op()) << ")";
            return ss.str();
        });

    py::class_<ContentStreamInlineImage>(m, "ContentStreamInlineImage")
        .def(py::init<ObjectList, Object>(),
            py::arg("image_metadata"),
            py::arg("image_data"))
        .def_property_readonly(
            "operator",
            [](ContentStreamInlineImage const &) { return std::string("INLINE IMAGE"); },
            "Always return the fictitious operator 'INLINE IMAGE'.")
        .def_property_readonly("image_metadata", &ContentStreamInlineImage::image_metadata)
        .def_property_readonly("image_data",
            [](ContentStreamInlineImage const &csii) {
                return py::bytes(csii.image_data().as_inline_image());
            })
        .def("unparse",
            [](ContentStreamInlineImage const &csii) {
                std::ostringstream ss;
                ss.imbue(std::locale::classic());
                ss << csii;
                return py::bytes(ss.str());
            })
        .def("__repr__", [](ContentStreamInlineImage const &csii) {
            return std::string("<pdfgraph.ContentStreamInlineImage(") +
                   std::to_string(csii.image_metadata().size()) +
                   " metadata tokens, data=<...>)>";
        });

    m.def("parse_content_stream",
         &parse_content_stream,
         py::arg("page_or_stream"),
         py::arg("operators") = "")
        .def("unparse_content_stream",
            [](std::vector<ContentStreamElement> const &elements) {
                return py::bytes(unparse_content_stream(elements));
            });
}
