// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <stdexcept>

#include <qpdf/QPDFExc.hh>

#include "pagelist.h"
#include "session.h"

namespace pdfgraph {

static void nonexistent_page(size_t index, size_t count)
{
    throw std::out_of_range("Accessing nonexistent PDF page number " +
                            std::to_string(index) + " of " + std::to_string(count));
}

size_t PageList::count() const
{
    return translate_errors([&] { return helper.getAllPages().size(); });
}

QPDFPageObjectHelper PageList::page_helper(size_t index) const
{
    auto pages = translate_errors([&] { return helper.getAllPages(); });
    if (index >= pages.size())
        nonexistent_page(index, pages.size());
    return pages.at(index);
}

std::optional<Object> PageList::get_page(size_t index) const
{
    if (index >= count())
        return std::nullopt;
    return doc.wrap(page_helper(index).getObjectHandle());
}

std::vector<Object> PageList::get_pages() const
{
    std::vector<Object> result;
    for (auto &page : translate_errors([&] { return helper.getAllPages(); }))
        result.push_back(doc.wrap(page.getObjectHandle()));
    return result;
}

QPDFPageObjectHelper PageList::page_from_object(Object const &page)
{
    if (!page.is_dictionary())
        throw TypeMismatchError(
            "only page dictionaries can be inserted; got " + page.type_name());
    if (page.is_indirect() && page.owner() != doc)
        throw ForeignObjectError("page belongs to another document; copy it with "
                                 "pdfgraph::Document::copy_foreign first");

    // PDFs in the wild often have malformed page objects, but when we're
    // building new pages we might as enforce correctness.
    if (!page.is_page())
        throw TypeMismatchError("only /Type /Page dictionaries can be inserted as pages");

    auto indirect = page.make_indirect();
    return QPDFPageObjectHelper(indirect.handle());
}

void PageList::set_page(size_t index, Object const &page)
{
    this->insert_page(index, page);
    if (index != this->count()) {
        this->delete_page(index + 1);
    }
}

void PageList::insert_page(size_t index, Object const &page)
{
    auto total = count();
    if (index > total)
        nonexistent_page(index, total);
    auto new_page = page_from_object(page);
    translate_errors([&] {
        if (index != total) {
            auto refpage = page_helper(index);
            helper.addPageAt(new_page, true, refpage);
        } else {
            helper.addPage(new_page, false);
        }
    });
}

void PageList::append_page(Object const &page) { insert_page(count(), page); }

void PageList::delete_page(size_t index)
{
    auto page = page_helper(index);
    translate_errors([&] { helper.removePage(page); });
}

void PageList::remove_page(Object const &page)
{
    auto index = index_of(page);
    if (!index)
        throw std::invalid_argument("Page is not in this document");
    delete_page(*index);
}

std::optional<size_t> PageList::index_of(Object const &page) const
{
    if (!page.is_indirect() || page.owner() != doc)
        return std::nullopt;
    auto objgen = page.handle().getObjGen();
    auto pages  = translate_errors([&] { return helper.getAllPages(); });
    for (size_t i = 0; i < pages.size(); ++i) {
        if (pages[i].getObjectHandle().getObjGen() == objgen)
            return i;
    }
    return std::nullopt;
}

} // namespace pdfgraph
