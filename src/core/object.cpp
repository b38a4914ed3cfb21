// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <ostream>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "document.h"
#include "namepath.h"
#include "object.h"
#include "session.h"
#include "utils.h"

namespace pdfgraph {

std::string type_name(ObjectType type)
{
    switch (type) {
    case ObjectType::Uninitialized:
        return "Uninitialized";
    case ObjectType::Reserved:
        return "Reserved";
    case ObjectType::Null:
        return "Null";
    case ObjectType::Boolean:
        return "Boolean";
    case ObjectType::Integer:
        return "Integer";
    case ObjectType::Real:
        return "Real";
    case ObjectType::String:
        return "String";
    case ObjectType::Name:
        return "Name";
    case ObjectType::Array:
        return "Array";
    case ObjectType::Dictionary:
        return "Dictionary";
    case ObjectType::Stream:
        return "Stream";
    case ObjectType::Operator:
        return "Operator";
    case ObjectType::InlineImage:
        return "InlineImage";
    }
    throw std::logic_error("invalid object type"); // LCOV_EXCL_LINE
}

qpdf_stream_decode_level_e to_qpdf(DecodeLevel level)
{
    switch (level) {
    case DecodeLevel::None:
        return qpdf_dl_none;
    case DecodeLevel::Generalized:
        return qpdf_dl_generalized;
    case DecodeLevel::Specialized:
        return qpdf_dl_specialized;
    case DecodeLevel::All:
        return qpdf_dl_all;
    }
    throw std::logic_error("invalid decode level"); // LCOV_EXCL_LINE
}

Object::Object(std::shared_ptr<Session> session, std::shared_ptr<Slot> slot)
    : session(std::move(session)), slot(std::move(slot))
{
}

Object::Object(Object const &other)
    : session(other.session), slot(copy_slot(other.session, other.slot))
{
}

Object &Object::operator=(Object const &other)
{
    if (this != &other) {
        auto new_slot = copy_slot(other.session, other.slot);
        session       = other.session;
        slot          = std::move(new_slot);
    }
    return *this;
}

// Indirect objects are shared; direct objects are copied up to, but not
// across, indirect boundaries
std::shared_ptr<Slot> Object::copy_slot(
    std::shared_ptr<Session> const &session, std::shared_ptr<Slot> const &slot)
{
    auto &oh = slot->oh;
    if (!oh.isInitialized())
        return session->new_slot(QPDFObjectHandle());
    if (oh.isIndirect())
        return slot;
    return session->new_slot(translate_errors([&] { return oh.shallowCopy(); }));
}

Object Object::alias() const { return Object(session, slot); }

QPDFObjectHandle &Object::handle() const { return slot->oh; }

bool operator<(Object const &a, Object const &b) noexcept
{
    return a.slot->serial < b.slot->serial;
}

ObjectType Object::get_type() const
{
    auto &oh = handle();
    if (!oh.isInitialized())
        return ObjectType::Uninitialized;

    switch (oh.getTypeCode()) {
    case qpdf_object_type_e::ot_uninitialized:
        return ObjectType::Uninitialized;
    case qpdf_object_type_e::ot_reserved:
        return ObjectType::Reserved;
    case qpdf_object_type_e::ot_null:
        return ObjectType::Null;
    case qpdf_object_type_e::ot_boolean:
        return ObjectType::Boolean;
    case qpdf_object_type_e::ot_integer:
        return ObjectType::Integer;
    case qpdf_object_type_e::ot_real:
        return ObjectType::Real;
    case qpdf_object_type_e::ot_string:
        return ObjectType::String;
    case qpdf_object_type_e::ot_name:
        return ObjectType::Name;
    case qpdf_object_type_e::ot_array:
        return ObjectType::Array;
    case qpdf_object_type_e::ot_dictionary:
        return ObjectType::Dictionary;
    case qpdf_object_type_e::ot_stream:
        return ObjectType::Stream;
    case qpdf_object_type_e::ot_operator:
        return ObjectType::Operator;
    case qpdf_object_type_e::ot_inlineimage:
        return ObjectType::InlineImage;
    // LCOV_EXCL_START
    default:
        throw std::logic_error(
            std::string("Unexpected qpdf object type: ") + oh.getTypeName());
        // LCOV_EXCL_STOP
    }
}

std::string Object::type_name() const { return pdfgraph::type_name(get_type()); }

bool Object::is_initialized() const { return handle().isInitialized(); }
bool Object::is_reserved() const { return get_type() == ObjectType::Reserved; }
bool Object::is_null() const { return get_type() == ObjectType::Null; }
bool Object::is_bool() const { return get_type() == ObjectType::Boolean; }
bool Object::is_integer() const { return get_type() == ObjectType::Integer; }
bool Object::is_real() const { return get_type() == ObjectType::Real; }
bool Object::is_string() const { return get_type() == ObjectType::String; }
bool Object::is_name() const { return get_type() == ObjectType::Name; }
bool Object::is_array() const { return get_type() == ObjectType::Array; }
bool Object::is_dictionary() const { return get_type() == ObjectType::Dictionary; }
bool Object::is_stream() const { return get_type() == ObjectType::Stream; }
bool Object::is_operator() const { return get_type() == ObjectType::Operator; }
bool Object::is_inline_image() const { return get_type() == ObjectType::InlineImage; }

bool Object::is_number() const
{
    auto type = get_type();
    return type == ObjectType::Integer || type == ObjectType::Real;
}

bool Object::is_scalar() const
{
    switch (get_type()) {
    case ObjectType::Boolean:
    case ObjectType::Integer:
    case ObjectType::Real:
    case ObjectType::String:
    case ObjectType::Name:
        return true;
    default:
        return false;
    }
}

bool Object::is_indirect() const
{
    auto &oh = handle();
    return oh.isInitialized() && oh.isIndirect();
}

// isPageObject needs an owning QPDF, which dictionaries built from
// constructors do not have until they are made indirect
bool Object::is_page() const
{
    if (!is_dictionary())
        return false;
    auto &h = handle();
    return h.isIndirect() ? h.isPageObject() : h.isDictionaryOfType("/Page");
}

int Object::get_id() const { return is_indirect() ? handle().getObjGen().getObj() : 0; }

int Object::get_generation() const
{
    return is_indirect() ? handle().getObjGen().getGen() : 0;
}

void Object::require_initialized(const char *operation) const
{
    if (!is_initialized())
        throw TypeMismatchError(
            std::string(operation) + " is not possible on an uninitialized object");
}

void Object::require_type(ObjectType expected) const
{
    auto actual = get_type();
    if (actual != expected)
        throw TypeMismatchError("Object is not " + pdfgraph::type_name(expected) +
                                "; it is " + pdfgraph::type_name(actual));
}

Object Object::make_indirect() const
{
    require_initialized("make_indirect");
    if (is_indirect())
        return alias();
    return translate_errors([&] {
        auto &q = session->qpdf();
        return session->wrap(q.makeIndirectObject(handle().shallowCopy()));
    });
}

Document Object::owner() const { return Document(session); }

bool Object::same_owner_as(Object const &other) const
{
    return session == other.session;
}

std::string Object::get_page_content_data() const
{
    require_type(ObjectType::Dictionary);
    std::string content;
    Pl_String pl("page contents", nullptr, content);
    try {
        QPDFPageObjectHelper(handle()).pipeContents(&pl);
    } catch (QPDFExc const &e) {
        throw DataDecodingError(std::string("object ") + handle().getObjGen().unparse() +
                                ": " + e.getMessageDetail());
    } catch (std::runtime_error const &e) {
        if (is_data_decoding_error(e))
            throw DataDecodingError(e.what());
        rethrow_translated(std::current_exception());
    }
    return content;
}

// Walk a NamePath, returning the object at its end or nullopt where a key or
// index is absent
std::optional<Object> Object::get_path(NamePath const &path) const
{
    if (path.is_root())
        return alias();

    QPDFObjectHandle current = handle();
    size_t depth             = 0;
    for (auto const &step : path) {
        if (step.is_name()) {
            if (!current.isDictionary() && !current.isStream())
                throw TypeMismatchError("Expected Dictionary or Stream at " +
                                        path.prefix(depth) + ", got " +
                                        current.getTypeName());
            auto dict = current.isStream() ? current.getDict() : current;
            if (!dict.hasKey(step.name))
                return std::nullopt;
            current = dict.getKey(step.name);
        } else {
            if (!current.isArray())
                throw TypeMismatchError("Expected Array at " + path.prefix(depth) +
                                        ", got " + current.getTypeName());
            int n     = current.getArrayNItems();
            int index = step.index < 0 ? step.index + n : step.index;
            if (index < 0 || index >= n)
                return std::nullopt;
            current = current.getArrayItem(index);
        }
        ++depth;
    }
    return session->wrap(current);
}

std::ostream &operator<<(std::ostream &os, Object const &obj)
{
    if (!obj.is_initialized())
        return os << "<uninitialized>";
    return os << obj.to_string();
}

} // namespace pdfgraph
