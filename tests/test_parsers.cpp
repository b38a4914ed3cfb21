// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <sstream>

#include <gtest/gtest.h>

#include "helpers.h"

using namespace pdfgraph;
using pdfgraph_test::make_page;

namespace {

const char *const graphics = "q 1 0 0 1 0 0 cm BT /F1 12 Tf (Hi) Tj ET Q";

std::vector<std::string> operators_of(std::vector<ContentStreamElement> const &elements)
{
    std::vector<std::string> ops;
    for (auto const &element : elements) {
        if (auto *csi = std::get_if<ContentStreamInstruction>(&element))
            ops.push_back(csi->op().as_operator());
        else
            ops.push_back("INLINE IMAGE");
    }
    return ops;
}

} // namespace

class ParserTest : public ::testing::Test {
protected:
    Document doc = Document::empty();
};

TEST_F(ParserTest, ParsePage)
{
    auto page     = make_page(doc, graphics);
    auto elements = parse_content_stream(page);
    ASSERT_EQ(elements.size(), 7u);
    EXPECT_EQ(operators_of(elements),
        (std::vector<std::string>{"q", "cm", "BT", "Tf", "Tj", "ET", "Q"}));

    auto const &cm = std::get<ContentStreamInstruction>(elements[1]);
    ASSERT_EQ(cm.operands().size(), 6u);
    EXPECT_EQ(cm.operands()[0].as_i64(), 1);

    auto const &tf = std::get<ContentStreamInstruction>(elements[3]);
    EXPECT_EQ(tf.operands()[0].as_name(), "/F1");
}

TEST_F(ParserTest, ParseStreamAndArray)
{
    auto stream = doc.new_stream(graphics);
    EXPECT_EQ(parse_content_stream(stream).size(), 7u);

    auto array = doc.new_array({doc.new_stream("q 1 w"), doc.new_stream("Q")});
    EXPECT_EQ(operators_of(parse_content_stream(array)),
        (std::vector<std::string>{"q", "w", "Q"}));
}

TEST_F(ParserTest, OperatorWhitelist)
{
    auto page     = make_page(doc, graphics);
    auto elements = parse_content_stream(page, "Tf Tj");
    EXPECT_EQ(operators_of(elements), (std::vector<std::string>{"Tf", "Tj"}));

    auto with_q = parse_content_stream(page, "q");
    EXPECT_EQ(operators_of(with_q), (std::vector<std::string>{"q", "Q"}));
}

TEST_F(ParserTest, UnparseThenReparse)
{
    auto page     = make_page(doc, graphics);
    auto elements = parse_content_stream(page);
    auto text     = unparse_content_stream(elements);
    EXPECT_NE(text.find("<4869> Tj\nET"), std::string::npos);

    auto reparsed = parse_content_stream(doc.new_stream(text));
    EXPECT_EQ(operators_of(reparsed), operators_of(elements));
}

TEST_F(ParserTest, InlineImage)
{
    auto stream = doc.new_stream(
        "q BI /W 1 /H 1 /BPC 8 /CS /G ID \x80 EI Q");
    auto elements = parse_content_stream(stream);
    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(operators_of(elements), (std::vector<std::string>{"q", "INLINE IMAGE", "Q"}));

    auto const &image = std::get<ContentStreamInlineImage>(elements[1]);
    ASSERT_EQ(image.image_metadata().size(), 8u);
    EXPECT_EQ(image.image_metadata()[0].as_name(), "/W");
    EXPECT_TRUE(image.image_data().is_inline_image());

    auto text = unparse_content_stream(elements);
    EXPECT_NE(text.find("BI\n/W 1 /H 1 /BPC 8 /CS /G\nID\n"), std::string::npos);
    EXPECT_EQ(operators_of(parse_content_stream(doc.new_stream(text))),
        operators_of(elements));
}

TEST_F(ParserTest, InstructionRequiresOperator)
{
    EXPECT_THROW(ContentStreamInstruction({}, doc.new_integer(1)), TypeMismatchError);
    EXPECT_THROW(ContentStreamInlineImage({}, doc.new_null()), TypeMismatchError);

    ContentStreamInstruction csi({doc.new_integer(1), doc.new_integer(2)}, doc.new_operator("m"));
    std::ostringstream ss;
    ss << csi;
    EXPECT_EQ(ss.str(), "1 2 m");
}

TEST_F(ParserTest, UnsupportedObject)
{
    EXPECT_THROW(parse_content_stream(doc.new_integer(3)), TypeMismatchError);
    EXPECT_THROW(parse_content_stream(doc.new_dictionary_from()), TypeMismatchError);
}

TEST_F(ParserTest, BuildContentFromInstructions)
{
    std::vector<ContentStreamElement> elements{
        ContentStreamInstruction({}, doc.new_operator("q")),
        ContentStreamInstruction({doc.new_real("0.5"), doc.new_integer(0), doc.new_integer(0)},
            doc.new_operator("rg")),
        ContentStreamInstruction({}, doc.new_operator("Q")),
    };
    EXPECT_EQ(unparse_content_stream(elements), "q\n0.5 0 0 rg\nQ");
    EXPECT_EQ(unparse_content_stream({}), "");
}
