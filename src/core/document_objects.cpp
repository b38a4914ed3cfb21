// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

/*
 * Object construction and parsing for Document
 */

#include <algorithm>
#include <map>
#include <stdexcept>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "document.h"
#include "session.h"
#include "utils.h"

namespace pdfgraph {

Object Document::new_null() const { return wrap(QPDFObjectHandle::newNull()); }

Object Document::new_bool(bool value) const { return wrap(QPDFObjectHandle::newBool(value)); }

Object Document::new_integer(long long value) const
{
    return wrap(QPDFObjectHandle::newInteger(value));
}

Object Document::new_real(double value, int decimal_places) const
{
    return wrap(QPDFObjectHandle::newReal(value, decimal_places));
}

Object Document::new_real(std::string const &decimal) const
{
    return wrap(QPDFObjectHandle::newReal(decimal));
}

Object Document::new_name(std::string const &name) const
{
    if (name.length() < 2)
        throw std::invalid_argument("Name must be at least one character long");
    if (name.at(0) != '/')
        throw std::invalid_argument("Name objects must begin with '/'");
    return wrap(QPDFObjectHandle::newName(name));
}

Object Document::new_string(std::string const &bytes) const
{
    return wrap(QPDFObjectHandle::newString(bytes));
}

Object Document::new_binary_string(std::string const &bytes) const
{
    return wrap(QPDFObjectHandle::newString(bytes));
}

// Stored as PDFDocEncoding when possible, otherwise as UTF-16BE with BOM
Object Document::new_utf8_string(std::string const &utf8) const
{
    return wrap(QPDFObjectHandle::newUnicodeString(utf8));
}

Object Document::new_array(std::vector<Object> const &items) const
{
    std::vector<QPDFObjectHandle> handles;
    handles.reserve(items.size());
    for (auto const &item : items)
        handles.push_back(session->store(item));
    return wrap(QPDFObjectHandle::newArray(handles));
}

Object Document::new_dictionary_from(ObjectPairs const &pairs) const
{
    std::map<std::string, QPDFObjectHandle> items;
    for (auto const &[key, value] : pairs) {
        check_dictionary_key(key);
        items[key] = session->store(value);
    }
    return wrap(QPDFObjectHandle::newDictionary(items));
}

Object Document::new_stream(std::string const &data) const
{
    return wrap(
        translate_errors([&] { return QPDFObjectHandle::newStream(&qpdf(), data); }));
}

Object Document::new_stream_with_dictionary(
    ObjectPairs const &pairs, std::string const &data) const
{
    for (auto const &[key, value] : pairs) {
        check_dictionary_key(key);
        if (key == "/Length")
            throw std::invalid_argument("/Length may not be modified");
    }
    auto stream = translate_errors([&] { return QPDFObjectHandle::newStream(&qpdf(), data); });
    auto dict = stream.getDict();
    for (auto const &[key, value] : pairs) {
        auto item = session->store(value);
        translate_errors([&] { dict.replaceKey(key, item); });
    }
    return wrap(stream);
}

Object Document::new_uninitialized() const { return wrap(QPDFObjectHandle()); }

Object Document::new_operator(std::string const &op) const
{
    return wrap(QPDFObjectHandle::newOperator(op));
}

Object Document::new_reserved() const
{
    return wrap(translate_errors([&] { return qpdf().newReserved(); }));
}

/*
 * Parse one object in the context of this document, so that "N G R"
 * references resolve. qpdf recovers from many syntax errors with a warning
 * rather than an exception; here any such warning fails the parse. Warnings
 * issued before the parse are put back.
 */
Object Document::parse_object(std::string const &text, std::string const &description) const
{
    auto &q              = qpdf();
    auto warnings_before = q.numWarnings();
    auto desc            = description.empty() ? std::string("parse_object") : description;

    // Remove the warnings raised by this parse, keeping the earlier ones.
    // They were reported when first issued.
    auto take_new_warnings = [&] {
        auto warnings = q.getWarnings();
        auto kept     = std::min(warnings_before, warnings.size());
        WarningSilencer silence(*session);
        for (size_t i = 0; i < kept; ++i)
            q.warn(warnings[i]);
        warnings.erase(warnings.begin(), warnings.begin() + kept);
        return warnings;
    };

    QPDFObjectHandle oh;
    try {
        oh = QPDFObjectHandle::parse(&q, text, desc);
    } catch (QPDFExc const &e) {
        take_new_warnings();
        throw ParseError(e.what(), static_cast<long long>(e.getFilePosition()));
    } catch (std::exception const &) {
        take_new_warnings();
        rethrow_translated(std::current_exception());
    }

    if (q.numWarnings() > warnings_before) {
        auto fresh        = take_new_warnings();
        auto const &first = fresh.front();
        throw ParseError(first.what(), static_cast<long long>(first.getFilePosition()));
    }
    return wrap(oh);
}

} // namespace pdfgraph
