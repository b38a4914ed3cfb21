// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

/*
 * Implement repr() for Object
 *
 * Since qpdf largely ignores const, it is not possible to use const here,
 * even though repr() is const throughout.
 *
 * References are used for functions that are just passing handles around.
 * objecthandle_repr_inner cannot use references because it calls itself.
 */

#include <algorithm>
#include <iomanip>
#include <locale>
#include <set>
#include <sstream>

#include <qpdf/Buffer.hh>
#include <qpdf/Constants.h>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "object.h"
#include "utils.h"

namespace pdfgraph {

static std::string objecthandle_scalar_value(QPDFObjectHandle &h)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    switch (h.getTypeCode()) {
    case qpdf_object_type_e::ot_null:
        ss << "null";
        break;
    case qpdf_object_type_e::ot_boolean:
        ss << (h.getBoolValue() ? "true" : "false");
        break;
    case qpdf_object_type_e::ot_integer:
        ss << std::to_string(h.getIntValue());
        break;
    case qpdf_object_type_e::ot_real:
        ss << h.getRealValue();
        break;
    case qpdf_object_type_e::ot_name:
        ss << std::quoted(h.getName());
        break;
    case qpdf_object_type_e::ot_string:
        ss << std::quoted(h.getUTF8Value());
        break;
    case qpdf_object_type_e::ot_operator:
        ss << std::quoted(h.getOperatorValue());
        break;
    default:
        throw std::logic_error("objecthandle_scalar_value called for non-scalar");
    }
    return ss.str();
}

static std::string objecthandle_typename(QPDFObjectHandle &h)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());

    switch (h.getTypeCode()) {
    case qpdf_object_type_e::ot_name:
        ss << "Name";
        break;
    case qpdf_object_type_e::ot_string:
        ss << "String";
        break;
    case qpdf_object_type_e::ot_operator:
        ss << "Operator";
        break;
    case qpdf_object_type_e::ot_inlineimage:
        ss << "InlineImage";
        break;
    case qpdf_object_type_e::ot_array:
        ss << "Array";
        break;
    case qpdf_object_type_e::ot_dictionary:
        if (h.hasKey("/Type") && h.getKey("/Type").isName()) {
            ss << "Dictionary(Type=\"" << h.getKey("/Type").getName() << "\")";
        } else {
            ss << "Dictionary";
        }
        break;
    case qpdf_object_type_e::ot_stream:
        ss << "Stream";
        break;
    case qpdf_object_type_e::ot_null:
    case qpdf_object_type_e::ot_boolean:
    case qpdf_object_type_e::ot_integer:
    case qpdf_object_type_e::ot_real:
        break; // No typename since literal is obvious

    default:
        throw std::logic_error(
            std::string("Unexpected object type name: ") + h.getTypeName());
    }

    return ss.str();
}

static std::string objecthandle_repr_typename_and_value(QPDFObjectHandle &h)
{
    auto name = objecthandle_typename(h);
    if (name.empty()) {
        return objecthandle_scalar_value(h);
    }
    return name + "(" + objecthandle_scalar_value(h) + ")";
}

// Bytes written the way a C string literal would show them
static std::string quoted_bytes(std::string const &data)
{
    static const char hexdigits[] = "0123456789abcdef";
    std::string result = "b\"";
    for (unsigned char c : data) {
        if (c == '"' || c == '\\') {
            result += '\\';
            result += static_cast<char>(c);
        } else if (c == '\n') {
            result += "\\n";
        } else if (c == '\r') {
            result += "\\r";
        } else if (c == '\t') {
            result += "\\t";
        } else if (c < 0x20 || c >= 0x7f) {
            result += "\\x";
            result += hexdigits[c >> 4];
            result += hexdigits[c & 0xf];
        } else {
            result += static_cast<char>(c);
        }
    }
    result += "\"";
    return result;
}

static std::string peek_stream_data(QPDFObjectHandle &h, unsigned recursion_depth)
{
    const unsigned MAX_PEEK_RECURSION_DEPTH = 1;
    const size_t MAX_PEEK_BYTES             = 20;

    if (recursion_depth > MAX_PEEK_RECURSION_DEPTH) {
        return "<...>";
    }

    std::shared_ptr<Buffer> buffer;
    std::string suffix;
    try {
        buffer = h.getStreamData();
    } catch (QPDFExc const &) {
        // Show what is there even if the filters cannot be undone
        buffer = h.getRawStreamData();
        suffix = " (undecodable)";
    }
    auto data = buffer->getBuffer();
    std::string data_str(reinterpret_cast<const char *>(data),
        std::min(MAX_PEEK_BYTES, buffer->getSize()));

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << quoted_bytes(data_str);
    if (buffer->getSize() > MAX_PEEK_BYTES)
        ss << "...";
    ss << suffix;
    return ss.str();
}

static std::string objecthandle_repr_inner(QPDFObjectHandle h,
    unsigned recursion_depth,
    unsigned indent_depth,
    unsigned &object_count,        // shared between recursive calls
    std::set<QPDFObjGen> &visited) // shared between recursive calls
{
    const unsigned MAX_OBJECT_COUNT = 40;

    StackGuard sg(" repr");
    std::ostringstream ss;
    ss.imbue(std::locale::classic());

    if (!h.isScalar()) {
        if (visited.count(h.getObjGen()) > 0) {
            ss << "<get_object_by_id(" << h.getObjectID() << ", " << h.getGeneration()
               << ")>";
            return ss.str();
        }

        if (!(h.getObjGen() == QPDFObjGen(0, 0)))
            visited.insert(h.getObjGen());
    }
    if (h.isPageObject() && recursion_depth >= 1 && h.isIndirect()) {
        ss << "<page " << h.getObjectID() << " " << h.getGeneration() << " R>";
        return ss.str();
    }
    object_count++;
    if (object_count > MAX_OBJECT_COUNT && recursion_depth > 1) {
        // If we've printed too many objects, start printing <...> instead
        // for objects that aren't the top level object.
        ss << "<...>";
        return ss.str();
    }

    switch (h.getTypeCode()) {
    case qpdf_object_type_e::ot_null:
    case qpdf_object_type_e::ot_boolean:
    case qpdf_object_type_e::ot_integer:
    case qpdf_object_type_e::ot_real:
    case qpdf_object_type_e::ot_name:
    case qpdf_object_type_e::ot_string:
        ss << objecthandle_scalar_value(h);
        break;
    case qpdf_object_type_e::ot_operator:
        ss << objecthandle_repr_typename_and_value(h);
        break;
    case qpdf_object_type_e::ot_inlineimage:
        ss << objecthandle_typename(h) << "("
           << "data=<...>"
           << ")";
        break;
    case qpdf_object_type_e::ot_reserved:
        ss << "<reserved>";
        break;
    case qpdf_object_type_e::ot_array:
        ss << "[";
        {
            bool first_item = true;
            ss << " ";
            for (auto item : h.getArrayAsVector()) {
                if (!first_item)
                    ss << ", ";
                first_item = false;
                // We don't increase indent_depth when recursing into arrays,
                // because it doesn't look right. Always increase recursion_depth.
                ss << objecthandle_repr_inner(
                    item, recursion_depth + 1, indent_depth, object_count, visited);
            }
            ss << " ";
        }
        ss << "]";
        break;
    case qpdf_object_type_e::ot_dictionary:
        ss << "{"; // This will end the line
        {
            bool first_item = true;
            ss << "\n";
            for (auto item : h.getDictAsMap()) {
                auto &key = item.first;
                auto &obj = item.second;
                if (!first_item)
                    ss << ",\n";
                first_item = false;
                ss << std::string((indent_depth + 1) * 2, ' '); // Indent each line
                if (key == "/Parent" && obj.isPagesObject()) {
                    // Don't visit /Parent keys since that just puts every page on the
                    // repr() of a single page
                    ss << std::quoted(key) << ": <reference to /Pages>";
                } else {
                    ss << std::quoted(key) << ": "
                       << objecthandle_repr_inner(obj,
                              recursion_depth + 1,
                              indent_depth + 1,
                              object_count,
                              visited);
                }
            }
            ss << "\n";
        }
        ss << std::string(indent_depth * 2, ' ') // Restore previous indent level
           << "}";
        break;
    case qpdf_object_type_e::ot_stream:
        ss << objecthandle_typename(h) << "("
           << "data=" << peek_stream_data(h, recursion_depth) << ", "
           << objecthandle_repr_inner(h.getDict(),
                  recursion_depth + 1,
                  indent_depth, // Don't indent here to align dict with stream
                  object_count,
                  visited)
           << ")";
        break;
    default:
        ss << "Unexpected object type value: " << h.getTypeCode();
        break;
    }

    return ss.str();
}

std::string repr(Object const &obj)
{
    if (!obj.is_initialized())
        return "<uninitialized>";
    if (obj.is_reserved())
        return "<reserved>";

    return translate_errors([&]() -> std::string {
        auto &h = obj.handle();
        if (h.isScalar() || h.isOperator()) {
            // qpdf does not consider Operator a scalar but it is as far we
            // are concerned here
            return objecthandle_repr_typename_and_value(h);
        }

        std::set<QPDFObjGen> visited;
        unsigned object_count = 0;
        std::string inner     = objecthandle_repr_inner(h, 0, 0, object_count, visited);

        if (h.isDictionary() || h.isArray()) {
            return objecthandle_typename(h) + "(" + inner + ")";
        }
        return inner;
    });
}

} // namespace pdfgraph
