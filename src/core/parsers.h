// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <set>
#include <string>
#include <variant>
#include <vector>

#include <qpdf/QPDFObjectHandle.hh>

#include "document.h"
#include "object.h"

namespace pdfgraph {

using ObjectList = std::vector<Object>;

class ContentStreamInstruction {
public:
    ContentStreamInstruction(ObjectList operands, Object op);

    ObjectList const &operands() const { return operands_; }
    Object const &op() const { return operator_; }

private:
    ObjectList operands_;
    Object operator_;
};

std::ostream &operator<<(std::ostream &os, ContentStreamInstruction const &csi);

// Inline images are reported as one element with the fictitious operator
// "INLINE IMAGE"
class ContentStreamInlineImage {
public:
    ContentStreamInlineImage(ObjectList image_metadata, Object image_data);

    // Alternating keys and values between BI and ID
    ObjectList const &image_metadata() const { return image_metadata_; }
    Object const &image_data() const { return image_data_; }

private:
    ObjectList image_metadata_;
    Object image_data_;
};

std::ostream &operator<<(std::ostream &os, ContentStreamInlineImage const &csii);

using ContentStreamElement = std::variant<ContentStreamInstruction, ContentStreamInlineImage>;

class OperandGrouper : public QPDFObjectHandle::ParserCallbacks {
public:
    OperandGrouper(Document doc, const std::string &operators);
    void handleObject(QPDFObjectHandle obj) override;
    void handleEOF() override;

    std::vector<ContentStreamElement> const &getInstructions() const
    {
        return instructions;
    }
    std::string getWarning() const { return warning; }

private:
    Document doc;
    std::set<std::string> whitelist;
    std::vector<QPDFObjectHandle> tokens;
    bool parsing_inline_image;
    std::vector<QPDFObjectHandle> inline_metadata;
    std::vector<ContentStreamElement> instructions;
    size_t count;
    std::string warning;
};

// Parse the content of a page, a content stream or an array of content
// streams. If operators is not empty, it is a space-separated list of the
// only operators to keep.
std::vector<ContentStreamElement> parse_content_stream(
    Object const &page_or_stream, std::string const &operators = "");

std::string unparse_content_stream(std::vector<ContentStreamElement> const &elements);

} // namespace pdfgraph
