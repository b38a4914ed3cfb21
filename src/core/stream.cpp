// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFExc.hh>

#include "session.h"
#include "utils.h"
#include "views.h"

namespace pdfgraph {

static std::string buffer_to_string(std::shared_ptr<Buffer> const &buffer)
{
    return std::string(reinterpret_cast<const char *>(buffer->getBuffer()),
        buffer->getSize());
}

Stream::Stream(Object const &obj) : obj(obj.alias())
{
    this->obj.require_type(ObjectType::Stream);
}

Stream::Stream(Object &&obj) : obj(std::move(obj))
{
    this->obj.require_type(ObjectType::Stream);
}

Dictionary Stream::get_stream_dictionary() const
{
    return Dictionary(obj.session->wrap(obj.handle().getDict()));
}

std::string Stream::get_stream_data(DecodeLevel level) const
{
    auto &h = obj.handle();
    // qpdf refuses getStreamData when no filter is to be applied
    if (level == DecodeLevel::None)
        return get_raw_stream_data();
    try {
        return buffer_to_string(h.getStreamData(to_qpdf(level)));
    } catch (const QPDFExc &e) {
        // Make a new exception that has the objgen info, since qpdf's
        // will not
        std::string msg = e.getMessageDetail();
        str_replace(msg, "getStreamData", "get_stream_data");
        throw DataDecodingError(
            std::string("object ") + h.getObjGen().unparse() + ": " + msg);
    } catch (const std::runtime_error &e) {
        if (is_data_decoding_error(e))
            throw DataDecodingError(
                std::string("object ") + h.getObjGen().unparse() + ": " + e.what());
        rethrow_translated(std::current_exception());
    }
}

std::string Stream::get_raw_stream_data() const
{
    return translate_errors([&] { return buffer_to_string(obj.handle().getRawStreamData()); });
}

void Stream::replace_stream_data(std::string const &data)
{
    translate_errors([&] {
        obj.handle().replaceStreamData(
            data, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
    });
}

void Stream::replace_stream_data(
    std::string const &data, Object const &filter, Object const &decode_parms)
{
    auto filter_oh       = obj.session->store(filter);
    auto decode_parms_oh = obj.session->store(decode_parms);
    translate_errors(
        [&] { obj.handle().replaceStreamData(data, filter_oh, decode_parms_oh); });
}

} // namespace pdfgraph
