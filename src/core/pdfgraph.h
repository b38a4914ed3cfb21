// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <string>
#include <utility>

#include "document.h"
#include "errors.h"
#include "logger.h"
#include "namepath.h"
#include "object.h"
#include "pagelist.h"
#include "parsers.h"
#include "views.h"
#include "writer.h"

namespace pdfgraph {

// Version of the libqpdf we are linked against
std::string qpdf_version();

// Applies to all streams compressed afterwards, in every document. -1 is
// zlib's default.
int set_flate_compression_level(int level);

// Returns false, with unknown substituted, if some character has no
// PDFDocEncoding equivalent
std::pair<bool, std::string> utf8_to_pdf_doc(std::string const &utf8, char unknown = '?');
std::string pdf_doc_to_utf8(std::string const &pdfdoc);

} // namespace pdfgraph
