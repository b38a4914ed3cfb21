// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <gtest/gtest.h>

#include "helpers.h"

using namespace pdfgraph;
using pdfgraph_test::make_document;
using pdfgraph_test::reopen;

TEST(Document, EmptyHasCatalogAndPageTree)
{
    auto doc  = Document::empty();
    auto root = doc.get_root();
    EXPECT_EQ(root.get("/Type")->as_name(), "/Catalog");
    EXPECT_TRUE(root.has("/Pages"));
    EXPECT_TRUE(doc.get_trailer().has("/Root"));
    EXPECT_EQ(doc.pages().count(), 0u);
    EXPECT_FALSE(doc.is_encrypted());
    EXPECT_FALSE(doc.encryption_info().has_value());
}

TEST(Document, OpenMissingFileIsIOError)
{
    EXPECT_THROW(Document::open("/nonexistent/dir/missing.pdf"), IOError);
}

TEST(Document, OpenGarbageIsPdfError)
{
    EXPECT_THROW(Document::open_memory("this is not a PDF file at all"), PdfError);
}

TEST(Document, OpenMemoryRoundTrip)
{
    auto doc = make_document(2);
    auto reopened = reopen(doc);
    EXPECT_EQ(reopened.pages().count(), 2u);
    EXPECT_FALSE(reopened.pdf_version().empty());
    EXPECT_EQ(reopened.filename(), "memory buffer");

    OpenOptions options;
    options.description = "in-memory test";
    auto described = Document::open_memory(Writer(doc, {}).write_to_memory(), options);
    EXPECT_EQ(described.filename(), "in-memory test");
}

TEST(Document, DefaultPermissionsAllowEverything)
{
    auto allow = Document::empty().permissions();
    EXPECT_TRUE(allow.accessibility);
    EXPECT_TRUE(allow.extract);
    EXPECT_TRUE(allow.modify_other);
    EXPECT_TRUE(allow.print_highres);
}

TEST(Document, ParseObject)
{
    auto doc = Document::empty();
    auto obj = doc.parse_object("<< /Type /Page /Count 3 /Kids [1 2 3] >>");
    EXPECT_TRUE(obj.is_dictionary());
    EXPECT_FALSE(obj.is_indirect());
    EXPECT_EQ(Dictionary(obj).get("/Count")->as_i64(), 3);

    EXPECT_EQ(doc.parse_object("(hello)").as_string(), "hello");
    EXPECT_EQ(doc.parse_object("3.5").as_real(), "3.5");
}

TEST(Document, ParseObjectResolvesReferences)
{
    auto doc  = Document::empty();
    auto root = doc.get_root().object();
    auto text = std::to_string(root.get_id()) + " 0 R";
    auto ref  = doc.parse_object(text);
    EXPECT_EQ(ref, root);
}

TEST(Document, ParseErrors)
{
    auto doc = Document::empty();
    EXPECT_THROW(doc.parse_object("<< /A 1"), ParseError);
    EXPECT_THROW(doc.parse_object("[1 2"), ParseError);
    EXPECT_THROW(doc.parse_object("<<--< /Type -- null >>"), ParseError);
    // A failed parse leaves no warnings behind
    EXPECT_TRUE(doc.get_warnings().empty());
}

TEST(Document, ParseErrorCarriesKind)
{
    auto doc = Document::empty();
    try {
        doc.parse_object("<< /A 1");
        FAIL() << "expected ParseError";
    } catch (PdfError const &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
    }
}

TEST(Document, GetObjectById)
{
    auto doc = Document::empty();
    EXPECT_FALSE(doc.get_object_by_id(0, 0).has_value());
    EXPECT_FALSE(doc.get_object_by_id(-1, 0).has_value());
    EXPECT_FALSE(doc.get_object_by_id(9999, 0).has_value());

    auto obj = doc.new_integer(12).make_indirect();
    auto found = doc.get_object_by_id(obj.get_id(), obj.get_generation());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->as_i64(), 12);
}

TEST(Document, GetAllObjects)
{
    auto doc    = make_document(1);
    auto before = doc.get_all_objects().size();
    doc.new_dictionary_from().make_indirect();
    EXPECT_EQ(doc.get_all_objects().size(), before + 1);
    for (auto &obj : doc.get_all_objects())
        EXPECT_TRUE(obj.is_indirect());
}

TEST(Document, ReplaceObject)
{
    auto doc = Document::empty();
    auto obj = doc.new_integer(1).make_indirect();
    doc.replace_object(obj.get_id(), obj.get_generation(), doc.new_integer(2));
    EXPECT_EQ(doc.get_object_by_id(obj.get_id(), 0)->as_i64(), 2);
}

TEST(Document, SwapObjects)
{
    auto doc = Document::empty();
    auto a   = doc.new_integer(1).make_indirect();
    auto b   = doc.new_integer(2).make_indirect();
    auto a_id = a.get_id();
    auto b_id = b.get_id();
    doc.swap_objects(a, b);
    EXPECT_EQ(doc.get_object_by_id(a_id, 0)->as_i64(), 2);
    EXPECT_EQ(doc.get_object_by_id(b_id, 0)->as_i64(), 1);

    EXPECT_THROW(doc.swap_objects(doc.new_integer(1), b), TypeMismatchError);
    auto other = Document::empty();
    EXPECT_THROW(
        doc.swap_objects(a, other.new_integer(1).make_indirect()), ForeignObjectError);
}

TEST(Document, ReservedObjects)
{
    auto doc      = Document::empty();
    auto reserved = doc.new_reserved();
    EXPECT_TRUE(reserved.is_reserved());
    EXPECT_TRUE(reserved.is_indirect());
    EXPECT_THROW(reserved.to_json(), TypeMismatchError);

    auto id = reserved.get_id();
    doc.replace_reserved(reserved, doc.new_dictionary_from({{"/Filled", doc.new_bool(true)}}));
    auto filled = doc.get_object_by_id(id, 0);
    ASSERT_TRUE(filled.has_value());
    EXPECT_TRUE(filled->is_dictionary());
    EXPECT_TRUE(Dictionary(*filled).get("/Filled")->as_bool());
}

TEST(Document, CopyForeign)
{
    auto source = make_document(1);
    auto target = Document::empty();
    auto page   = *source.pages().get_page(0);

    auto copied = target.copy_foreign(page);
    EXPECT_TRUE(copied.is_indirect());
    EXPECT_EQ(copied.owner(), target);
    target.pages().append_page(copied);
    EXPECT_EQ(target.pages().count(), 1u);
    EXPECT_EQ(copied.get_page_content_data(), pdfgraph_test::page_content(1));

    // Copying an object of the document itself is an error
    EXPECT_THROW(target.copy_foreign(copied), ForeignObjectError);
}

TEST(Document, CloseKeepsLoadedObjects)
{
    auto doc      = make_document(1);
    auto reopened = reopen(doc);
    auto page     = *reopened.pages().get_page(0);
    auto content  = page.get_page_content_data();
    reopened.close();
    EXPECT_TRUE(page.is_page());
}

TEST(Document, Encrypted)
{
    auto doc = make_document(1);
    WriterConfig config;
    config.encryption = Encryption{};
    config.encryption->owner = "owner";
    config.encryption->user  = "user";
    auto data = Writer(doc, config).write_to_memory();

    EXPECT_THROW(Document::open_memory(data), PasswordError);

    OpenOptions options;
    options.password = "wrong";
    EXPECT_THROW(Document::open_memory(data, options), PasswordError);

    options.password = "user";
    auto opened = Document::open_memory(data, options);
    EXPECT_TRUE(opened.is_encrypted());
    EXPECT_TRUE(opened.user_password_matched());
    EXPECT_FALSE(opened.owner_password_matched());
    auto info = opened.encryption_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->R, 6);
    EXPECT_EQ(info->stream_method, EncryptionMethod::AESv3);
    EXPECT_EQ(opened.pages().get_page(0)->get_page_content_data(),
        pdfgraph_test::page_content(1));

    options.password = "owner";
    EXPECT_TRUE(Document::open_memory(data, options).owner_password_matched());
}
