// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include <qpdf/Constants.h>
#include <qpdf/QPDFObjectHandle.hh>

#include "errors.h"

namespace pdfgraph {

class Session;
struct Slot;
class Document;
class NamePath;

enum class ObjectType {
    Uninitialized,
    Reserved,
    Null,
    Boolean,
    Integer,
    Real,
    String,
    Name,
    Array,
    Dictionary,
    Stream,
    Operator,
    InlineImage,
};

// Ordered: each level applies every filter the previous one does, and more
enum class DecodeLevel { None, Generalized, Specialized, All };

std::string type_name(ObjectType type);
qpdf_stream_decode_level_e to_qpdf(DecodeLevel level);

/*
 * Handle onto one node of a document's object graph.
 *
 * An Object keeps its Document alive, so a handle can never dangle.
 *
 * Identity: two Objects are equal when they refer to the same slot. Every
 * lookup of an indirect object returns the same slot, so all handles to
 * "5 0 R" compare equal and observe each other's mutations. Direct objects
 * get a fresh slot per handle. Copying a handle to a direct object takes a
 * snapshot of its value; copying a handle to an indirect object shares it.
 * Use equivalent() to compare by value.
 */
class Object {
public:
    Object(Object const &other);
    Object(Object &&other) noexcept            = default;
    Object &operator=(Object const &other);
    Object &operator=(Object &&other) noexcept = default;
    ~Object()                                  = default;

    ObjectType get_type() const;
    std::string type_name() const;

    bool is_initialized() const;
    bool is_reserved() const;
    bool is_null() const;
    bool is_bool() const;
    bool is_integer() const;
    bool is_real() const;
    bool is_number() const;
    bool is_string() const;
    bool is_name() const;
    bool is_array() const;
    bool is_dictionary() const;
    bool is_stream() const;
    bool is_operator() const;
    bool is_inline_image() const;
    // Boolean, Integer, Real, String and Name. Null is not a scalar.
    bool is_scalar() const;
    bool is_indirect() const;
    bool is_page() const;

    // Both are 0 for direct objects
    int get_id() const;
    int get_generation() const;

    Object make_indirect() const;

    // Scalar accessors throw TypeMismatchError unless the type matches.
    // as_real and as_number also accept integers.
    bool as_bool() const;
    long long as_i64() const;
    int as_i32() const;
    std::string as_real() const;
    double as_number() const;
    std::string as_name() const;
    std::string as_string() const;
    std::string as_binary_string() const;
    std::string as_operator() const;
    std::string as_inline_image() const;

    std::string to_string() const;
    std::string to_binary() const;
    std::string to_json(bool dereference = false) const;

    // Decoded content of all content streams of a page dictionary
    std::string get_page_content_data() const;

    std::optional<Object> get_path(NamePath const &path) const;

    Document owner() const;
    bool same_owner_as(Object const &other) const;

    // qpdf ignores const, so the underlying handle is reachable from const
    QPDFObjectHandle &handle() const;

    friend bool operator==(Object const &a, Object const &b) noexcept
    {
        return a.slot == b.slot;
    }
    friend bool operator!=(Object const &a, Object const &b) noexcept
    {
        return !(a == b);
    }
    friend bool operator<(Object const &a, Object const &b) noexcept;

private:
    Object(std::shared_ptr<Session> session, std::shared_ptr<Slot> slot);

    // Another handle on the same slot, bypassing snapshot-on-copy
    Object alias() const;
    void require_initialized(const char *operation) const;
    void require_type(ObjectType expected) const;
    static std::shared_ptr<Slot> copy_slot(
        std::shared_ptr<Session> const &session, std::shared_ptr<Slot> const &slot);

    std::shared_ptr<Session> session;
    std::shared_ptr<Slot> slot;

    friend class Session;
    friend class Array;
    friend class Dictionary;
    friend class Stream;
    friend class Document;
};

std::ostream &operator<<(std::ostream &os, Object const &obj);

// From object_equality.cpp
// Compare by value: numbers numerically, strings by bytes or text, containers
// recursively. Independent of handle identity.
bool equivalent(Object const &a, Object const &b);

// From object_repr.cpp
std::string repr(Object const &obj);

} // namespace pdfgraph
