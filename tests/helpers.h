// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <string>

#include "pdfgraph.h"

namespace pdfgraph_test {

using namespace pdfgraph;

// A bare page with one content stream that draws text
inline Object make_page(Document &doc, std::string const &content)
{
    auto page = doc.parse_object("<< /Type /Page /MediaBox [0 0 612 792] /Resources << >> >>")
                    .make_indirect();
    Dictionary(page).set("/Contents", doc.new_stream(content));
    return page;
}

inline std::string page_content(int n)
{
    return "BT /F1 12 Tf 72 720 Td (page " + std::to_string(n) + ") Tj ET";
}

// A document with pages whose contents are page_content(1) ... page_content(n)
inline Document make_document(int npages)
{
    auto doc = Document::empty();
    for (int i = 1; i <= npages; ++i)
        doc.pages().append_page(make_page(doc, page_content(i)));
    return doc;
}

inline Document reopen(Document &doc, WriterConfig config = {})
{
    Writer writer(doc, std::move(config));
    return Document::open_memory(writer.write_to_memory());
}

} // namespace pdfgraph_test
