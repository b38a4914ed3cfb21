// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

/*
 * Scalar accessors and serialized forms of Object
 *
 * Every accessor checks the type first; qpdf itself would warn and return a
 * default value, which would hide mistakes.
 */

#include <limits>
#include <stdexcept>

#include <qpdf/JSON.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "object.h"
#include "session.h"

namespace pdfgraph {

bool Object::as_bool() const
{
    require_type(ObjectType::Boolean);
    return handle().getBoolValue();
}

long long Object::as_i64() const
{
    require_type(ObjectType::Integer);
    return handle().getIntValue();
}

int Object::as_i32() const
{
    auto value = as_i64();
    if (value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max())
        throw std::out_of_range(
            "integer " + std::to_string(value) + " does not fit in 32 bits");
    return static_cast<int>(value);
}

// Reals keep the decimal text they were parsed or created with
std::string Object::as_real() const
{
    if (is_integer())
        return std::to_string(handle().getIntValue());
    require_type(ObjectType::Real);
    return handle().getRealValue();
}

double Object::as_number() const
{
    if (!is_number())
        throw TypeMismatchError("Object is not a number; it is " + type_name());
    return handle().getNumericValue();
}

std::string Object::as_name() const
{
    require_type(ObjectType::Name);
    return handle().getName();
}

std::string Object::as_string() const
{
    require_type(ObjectType::String);
    return handle().getUTF8Value();
}

std::string Object::as_binary_string() const
{
    require_type(ObjectType::String);
    return handle().getStringValue();
}

std::string Object::as_operator() const
{
    require_type(ObjectType::Operator);
    return handle().getOperatorValue();
}

std::string Object::as_inline_image() const
{
    require_type(ObjectType::InlineImage);
    return handle().getInlineImageValue();
}

std::string Object::to_string() const
{
    require_initialized("to_string");
    return translate_errors([&] { return handle().unparse(); });
}

std::string Object::to_binary() const
{
    require_initialized("to_binary");
    return translate_errors([&] { return handle().unparseBinary(); });
}

std::string Object::to_json(bool dereference) const
{
    require_initialized("to_json");
    if (is_reserved())
        throw TypeMismatchError("reserved objects cannot be represented as JSON");
    return translate_errors(
        [&] { return handle().getJSON(2, dereference).unparse(); });
}

} // namespace pdfgraph
