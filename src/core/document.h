// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <qpdf/QPDF.hh>

#include "object.h"
#include "views.h"

namespace pdfgraph {

class Session;
class PageList;
class OperandGrouper;

struct OpenOptions {
    std::string password;
    // Treat password as the hex-encoded encryption key
    bool hex_password            = false;
    bool ignore_xref_streams     = false;
    bool suppress_warnings       = true;
    bool attempt_recovery        = true;
    bool inherit_page_attributes = true;
    // Used in error messages in place of the filename
    std::string description;
};

enum class EncryptionMethod { None, Unknown, RC4, AES, AESv3 };

struct EncryptionInfo {
    int R                          = 0;
    int P                          = 0;
    int V                          = 0;
    EncryptionMethod stream_method = EncryptionMethod::None;
    EncryptionMethod string_method = EncryptionMethod::None;
    EncryptionMethod file_method   = EncryptionMethod::None;
    std::string user_password;
    std::string encryption_key;
};

struct Permissions {
    bool accessibility     = true;
    bool extract           = true;
    bool modify_annotation = true;
    bool modify_assembly   = true;
    bool modify_form       = true;
    bool modify_other      = true;
    bool print_lowres      = true;
    bool print_highres     = true;
};

using ObjectPairs = std::vector<std::pair<std::string, Object>>;

/*
 * One PDF session. Copies of a Document share the same session.
 *
 * Constructors other than new_stream* and new_reserved return direct
 * objects; use Object::make_indirect to register them in the document.
 * Streams are always indirect.
 */
class Document {
public:
    static Document empty();
    static Document open(std::string const &filename, OpenOptions const &options = {});
    static Document open_memory(std::string data, OpenOptions const &options = {});

    std::string filename() const;
    std::string pdf_version() const;
    int extension_level() const;

    bool is_encrypted() const;
    std::optional<EncryptionInfo> encryption_info() const;
    Permissions permissions() const;
    bool user_password_matched() const;
    bool owner_password_matched() const;

    bool is_linearized() const;
    bool check_linearization() const;

    // Returns and clears the warnings accumulated so far
    std::vector<std::string> get_warnings();

    Dictionary get_trailer() const;
    Dictionary get_root() const;

    std::optional<Object> get_object_by_id(int id, int generation) const;
    std::vector<Object> get_all_objects() const;

    Object parse_object(
        std::string const &text, std::string const &description = "") const;

    Object new_null() const;
    Object new_bool(bool value) const;
    Object new_integer(long long value) const;
    Object new_real(double value, int decimal_places = 0) const;
    Object new_real(std::string const &decimal) const;
    Object new_name(std::string const &name) const;
    Object new_string(std::string const &bytes) const;
    Object new_binary_string(std::string const &bytes) const;
    Object new_utf8_string(std::string const &utf8) const;
    Object new_array(std::vector<Object> const &items = {}) const;
    Object new_dictionary_from(ObjectPairs const &pairs = {}) const;
    Object new_stream(std::string const &data = "") const;
    Object new_stream_with_dictionary(ObjectPairs const &pairs, std::string const &data) const;
    Object new_uninitialized() const;
    Object new_operator(std::string const &op) const;
    Object new_reserved() const;

    Object copy_foreign(Object const &foreign);
    void replace_object(int id, int generation, Object const &replacement);
    void swap_objects(Object const &a, Object const &b);
    void replace_reserved(Object const &reserved, Object const &replacement);

    PageList pages() const;
    void add_page(Object const &page, bool first);
    void remove_page(Object const &page);

    // Release the input file; objects already loaded remain usable
    void close();

    QPDF &qpdf() const;

    friend bool operator==(Document const &a, Document const &b)
    {
        return a.session == b.session;
    }
    friend bool operator!=(Document const &a, Document const &b) { return !(a == b); }

private:
    explicit Document(std::shared_ptr<Session> session);
    Object wrap(QPDFObjectHandle oh) const;

    std::shared_ptr<Session> session;

    friend class Object;
    friend class PageList;
    friend class OperandGrouper;
};

} // namespace pdfgraph
