// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <locale>
#include <sstream>

#include <qpdf/QPDFPageObjectHelper.hh>

#include "logger.h"
#include "parsers.h"

namespace pdfgraph {

ContentStreamInstruction::ContentStreamInstruction(ObjectList operands, Object op)
    : operands_(std::move(operands)), operator_(std::move(op))
{
    if (!this->operator_.is_operator())
        throw TypeMismatchError("operator parameter must be an Operator, not " +
                                this->operator_.type_name());
}

std::ostream &operator<<(std::ostream &os, ContentStreamInstruction const &csi)
{
    for (auto const &obj : csi.operands()) {
        os << obj.to_binary() << " ";
    }
    os << csi.op().to_binary();
    return os;
}

ContentStreamInlineImage::ContentStreamInlineImage(
    ObjectList image_metadata, Object image_data)
    : image_metadata_(std::move(image_metadata)), image_data_(std::move(image_data))
{
    if (!this->image_data_.is_inline_image())
        throw TypeMismatchError("image_data must be an InlineImage, not " +
                                this->image_data_.type_name());
}

std::ostream &operator<<(std::ostream &os, ContentStreamInlineImage const &csii)
{
    os << "BI\n";
    const char *delim = "";
    for (auto const &obj : csii.image_metadata()) {
        os << delim << obj.to_binary();
        delim = " ";
    }
    os << "\nID\n";
    os << csii.image_data().as_inline_image();
    os << "EI";
    return os;
}

OperandGrouper::OperandGrouper(Document doc, const std::string &operators)
    : doc(std::move(doc)), parsing_inline_image(false), count(0)
{
    std::istringstream f(operators);
    f.imbue(std::locale::classic());
    std::string s;
    while (std::getline(f, s, ' ')) {
        if (!s.empty())
            this->whitelist.insert(s);
    }
}

void OperandGrouper::handleObject(QPDFObjectHandle obj)
{
    this->count++;
    if (obj.getTypeCode() == qpdf_object_type_e::ot_operator) {
        std::string op = obj.getOperatorValue();

        // If we have a whitelist and this operator is not on the whitelist,
        // discard it and all the tokens we collected
        if (!this->whitelist.empty()) {
            if (op[0] == 'q' || op[0] == 'Q') {
                // We have token with multiple stack push/pops
                if (this->whitelist.count("q") == 0 &&
                    this->whitelist.count("Q") == 0) {
                    this->tokens.clear();
                    return;
                }
            } else if (this->whitelist.count(op) == 0) {
                this->tokens.clear();
                return;
            }
        }
        if (op == "BI") {
            this->parsing_inline_image = true;
        } else if (this->parsing_inline_image) {
            if (op == "ID") {
                this->inline_metadata = this->tokens;
            } else if (op == "EI") {
                ObjectList metadata;
                for (auto &oh : this->inline_metadata)
                    metadata.push_back(doc.wrap(oh));
                this->instructions.emplace_back(
                    ContentStreamInlineImage(metadata, doc.wrap(this->tokens.at(0))));
                this->inline_metadata.clear();
                this->parsing_inline_image = false;
            }
        } else {
            ObjectList operands;
            for (auto &oh : this->tokens)
                operands.push_back(doc.wrap(oh));
            this->instructions.emplace_back(
                ContentStreamInstruction(operands, doc.wrap(obj)));
        }
        this->tokens.clear();
    } else {
        this->tokens.push_back(obj);
    }
}

void OperandGrouper::handleEOF()
{
    if (!this->tokens.empty())
        this->warning = "Unexpected end of stream";
}

std::vector<ContentStreamElement> parse_content_stream(
    Object const &page_or_stream, std::string const &operators)
{
    OperandGrouper og(page_or_stream.owner(), operators);
    auto &h = page_or_stream.handle();
    translate_errors([&] {
        if (page_or_stream.is_page()) {
            QPDFPageObjectHelper(h).parseContents(&og);
        } else if (page_or_stream.is_stream() || page_or_stream.is_array()) {
            QPDFObjectHandle::parseContentStream(h, &og);
        } else {
            throw TypeMismatchError(
                "parse_content_stream requires a page, stream or array of streams, "
                "not " +
                page_or_stream.type_name());
        }
    });
    if (!og.getWarning().empty()) {
        get_pdfgraph_logger()->warn(og.getWarning() + "\n");
    }
    return og.getInstructions();
}

std::string unparse_content_stream(std::vector<ContentStreamElement> const &elements)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    const char *delim = "";

    for (auto const &item : elements) {
        // First iteration: print nothing
        // All others: print "\n" to delimit previous
        // Result is no leading or trailing delimiter
        ss << delim;
        delim = "\n";
        std::visit([&ss](auto const &element) { ss << element; }, item);
    }
    return ss.str();
}

} // namespace pdfgraph
