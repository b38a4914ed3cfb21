// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <optional>
#include <vector>

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "document.h"
#include "object.h"

namespace pdfgraph {

// Page tree access. Pages are indirect /Type /Page dictionaries; a direct page
// dictionary is made indirect when inserted.
class PageList {
public:
    explicit PageList(Document doc) : doc(std::move(doc)), helper(this->doc.qpdf()) {}

    size_t count() const;
    std::optional<Object> get_page(size_t index) const;
    std::vector<Object> get_pages() const;
    void set_page(size_t index, Object const &page);
    void insert_page(size_t index, Object const &page);
    void append_page(Object const &page);
    void delete_page(size_t index);
    void remove_page(Object const &page);
    std::optional<size_t> index_of(Object const &page) const;

private:
    QPDFPageObjectHelper page_from_object(Object const &page);
    QPDFPageObjectHelper page_helper(size_t index) const;

    Document doc;
    mutable QPDFPageDocumentHelper helper;
};

} // namespace pdfgraph
