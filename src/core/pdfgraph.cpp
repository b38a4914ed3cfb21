// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <stdexcept>

#include <qpdf/Pl_Flate.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QUtil.hh>

#include "pdfgraph.h"

namespace pdfgraph {

std::string qpdf_version() { return QPDF::QPDFVersion(); }

int set_flate_compression_level(int level)
{
    if (-1 <= level && level <= 9) {
        Pl_Flate::setCompressionLevel(level);
        return level;
    }
    throw std::invalid_argument("Flate compression level must be between 0 and 9 (or -1)");
}

std::pair<bool, std::string> utf8_to_pdf_doc(std::string const &utf8, char unknown)
{
    std::string pdfdoc;
    bool success = QUtil::utf8_to_pdf_doc(utf8, pdfdoc, unknown);
    return std::make_pair(success, pdfdoc);
}

std::string pdf_doc_to_utf8(std::string const &pdfdoc) { return QUtil::pdf_doc_to_utf8(pdfdoc); }

} // namespace pdfgraph
