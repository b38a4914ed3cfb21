// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <sstream>

#include <gtest/gtest.h>

#include "helpers.h"

using namespace pdfgraph;

class ObjectTest : public ::testing::Test {
protected:
    Document doc = Document::empty();
};

TEST_F(ObjectTest, BoolRoundTrip)
{
    auto t = doc.new_bool(true);
    EXPECT_EQ(t.get_type(), ObjectType::Boolean);
    EXPECT_TRUE(t.as_bool());
    EXPECT_FALSE(doc.new_bool(false).as_bool());
    EXPECT_THROW(t.as_i64(), TypeMismatchError);
    EXPECT_THROW(t.as_number(), TypeMismatchError);
}

TEST_F(ObjectTest, IntegerAccessors)
{
    auto i = doc.new_integer(42);
    EXPECT_TRUE(i.is_integer());
    EXPECT_TRUE(i.is_number());
    EXPECT_TRUE(i.is_scalar());
    EXPECT_EQ(i.as_i64(), 42);
    EXPECT_EQ(i.as_i32(), 42);
    EXPECT_EQ(i.as_real(), "42");
    EXPECT_DOUBLE_EQ(i.as_number(), 42.0);
    EXPECT_THROW(i.as_bool(), TypeMismatchError);
    EXPECT_THROW(i.as_name(), TypeMismatchError);
}

TEST_F(ObjectTest, IntegerTooLargeFor32Bits)
{
    auto big = doc.new_integer(1LL << 40);
    EXPECT_EQ(big.as_i64(), 1LL << 40);
    EXPECT_THROW(big.as_i32(), std::out_of_range);
}

TEST_F(ObjectTest, RealKeepsDecimalText)
{
    auto r = doc.new_real("3.14");
    EXPECT_TRUE(r.is_real());
    EXPECT_EQ(r.as_real(), "3.14");
    EXPECT_DOUBLE_EQ(r.as_number(), 3.14);
    EXPECT_THROW(r.as_i64(), TypeMismatchError);
    EXPECT_DOUBLE_EQ(doc.new_real(2.5, 2).as_number(), 2.5);
}

TEST_F(ObjectTest, Names)
{
    auto n = doc.new_name("/Type");
    EXPECT_TRUE(n.is_name());
    EXPECT_EQ(n.as_name(), "/Type");
    EXPECT_EQ(n.to_string(), "/Type");
    EXPECT_THROW(doc.new_name("Type"), std::invalid_argument);
    EXPECT_THROW(doc.new_name("/"), std::invalid_argument);
    EXPECT_THROW(doc.new_name(""), std::invalid_argument);
}

TEST_F(ObjectTest, TextStringsRoundTripUtf8)
{
    auto s = doc.new_utf8_string("h\xc3\xa9llo");
    EXPECT_TRUE(s.is_string());
    EXPECT_EQ(s.as_string(), "h\xc3\xa9llo");
}

TEST_F(ObjectTest, TextOutsidePdfDocEncodingUsesUtf16)
{
    // U+65E5 U+672C
    auto s = doc.new_utf8_string("\xe6\x97\xa5\xe6\x9c\xac");
    auto raw = s.as_binary_string();
    ASSERT_GE(raw.size(), 2u);
    EXPECT_EQ(raw.substr(0, 2), std::string("\xfe\xff"));
    EXPECT_EQ(s.as_string(), "\xe6\x97\xa5\xe6\x9c\xac");
}

TEST_F(ObjectTest, BinaryUnparseIsHex)
{
    EXPECT_EQ(doc.new_string("hello").to_string(), "(hello)");
    EXPECT_EQ(doc.new_string("hello").to_binary(), "<68656c6c6f>");
    // "привет"
    auto text = doc.new_utf8_string("\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82");
    EXPECT_EQ(text.to_binary(), "<feff043f04400438043204350442>");
}

TEST_F(ObjectTest, BinaryStringsKeepBytes)
{
    std::string bytes("\xff\x00\x01", 3);
    auto s = doc.new_binary_string(bytes);
    EXPECT_EQ(s.as_binary_string(), bytes);
    EXPECT_EQ(s.as_binary_string().size(), 3u);
}

TEST_F(ObjectTest, OperatorAndNull)
{
    auto op = doc.new_operator("Tj");
    EXPECT_TRUE(op.is_operator());
    EXPECT_EQ(op.as_operator(), "Tj");
    EXPECT_FALSE(op.is_scalar());

    auto null = doc.new_null();
    EXPECT_TRUE(null.is_null());
    EXPECT_FALSE(null.is_scalar());
    EXPECT_EQ(null.to_string(), "null");
}

TEST_F(ObjectTest, Unparse)
{
    EXPECT_EQ(doc.new_integer(7).to_string(), "7");
    EXPECT_EQ(doc.new_array({doc.new_integer(1), doc.new_integer(2)}).to_string(),
        "[ 1 2 ]");
    EXPECT_EQ(doc.new_dictionary_from({{"/A", doc.new_integer(1)}}).to_string(),
        "<< /A 1 >>");
    EXPECT_EQ(doc.new_integer(7).to_json(), "7");
}

TEST_F(ObjectTest, UnparseScalars)
{
    EXPECT_EQ(doc.new_real(1.2345, 3).to_string(), "1.234");
    EXPECT_EQ(doc.new_integer(1234567890).to_string(), "1234567890");
    EXPECT_EQ(doc.new_bool(true).to_string(), "true");
    EXPECT_EQ(doc.new_bool(false).to_string(), "false");
    EXPECT_EQ(doc.new_binary_string(std::string("\x01\x02\x03\x04", 4)).to_binary(),
        "<01020304>");
}

TEST_F(ObjectTest, Printing)
{
    std::ostringstream ss;
    ss << doc.new_integer(3) << " " << doc.new_name("/X") << " " << doc.new_uninitialized();
    EXPECT_EQ(ss.str(), "3 /X <uninitialized>");
}

TEST_F(ObjectTest, Uninitialized)
{
    auto u = doc.new_uninitialized();
    EXPECT_FALSE(u.is_initialized());
    EXPECT_EQ(u.get_type(), ObjectType::Uninitialized);
    EXPECT_EQ(u.type_name(), "Uninitialized");
    EXPECT_THROW(u.to_string(), TypeMismatchError);
    EXPECT_THROW(u.make_indirect(), TypeMismatchError);
    EXPECT_THROW(doc.new_array({u}), TypeMismatchError);
}

TEST_F(ObjectTest, CopyOfDirectObjectIsSnapshot)
{
    auto a = doc.new_integer(5);
    auto b = a;
    EXPECT_NE(a, b);
    EXPECT_TRUE(equivalent(a, b));

    auto dict = doc.new_dictionary_from();
    auto copy = dict;
    Dictionary(copy).set("/A", doc.new_integer(1));
    EXPECT_FALSE(Dictionary(dict).has("/A"));
    EXPECT_TRUE(Dictionary(copy).has("/A"));
}

TEST_F(ObjectTest, CopyOfIndirectObjectIsShared)
{
    auto d = doc.new_dictionary_from().make_indirect();
    auto e = d;
    EXPECT_EQ(d, e);
    Dictionary(e).set("/K", doc.new_integer(1));
    EXPECT_TRUE(Dictionary(d).has("/K"));
}

TEST_F(ObjectTest, ViewsAliasTheirObject)
{
    auto dict = doc.new_dictionary_from();
    Dictionary view(dict);
    view.set("/A", doc.new_integer(1));
    EXPECT_TRUE(Dictionary(dict).has("/A"));
    EXPECT_EQ(view.object(), dict);
}

TEST_F(ObjectTest, LookupsOfOneIndirectObjectShareASlot)
{
    auto root = doc.get_root().object();
    auto again = doc.get_object_by_id(root.get_id(), root.get_generation());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, root);
    EXPECT_FALSE(*again < root);
    EXPECT_FALSE(root < *again);
}

TEST_F(ObjectTest, StoredDirectValueIsSnapshot)
{
    auto inner = doc.new_array();
    auto outer = doc.new_dictionary_from();
    Dictionary(outer).set("/Arr", inner);
    Array(inner).push(doc.new_integer(1));
    auto stored = Dictionary(outer).get("/Arr");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(Array(*stored).size(), 0u);
}

TEST_F(ObjectTest, MakeIndirect)
{
    auto d = doc.new_dictionary_from({{"/A", doc.new_integer(1)}});
    EXPECT_FALSE(d.is_indirect());
    EXPECT_EQ(d.get_id(), 0);

    auto ind = d.make_indirect();
    EXPECT_TRUE(ind.is_indirect());
    EXPECT_GT(ind.get_id(), 0);
    EXPECT_FALSE(d.is_indirect());
    EXPECT_EQ(ind.make_indirect(), ind);
    EXPECT_TRUE(equivalent(d, ind));

    auto fetched = doc.get_object_by_id(ind.get_id(), 0);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(*fetched, ind);
}

TEST_F(ObjectTest, StreamsAreAlwaysIndirect)
{
    auto s = doc.new_stream("abc");
    EXPECT_TRUE(s.is_stream());
    EXPECT_TRUE(s.is_indirect());
    EXPECT_EQ(s.make_indirect(), s);
}

TEST_F(ObjectTest, Owner)
{
    auto other = Document::empty();
    auto a     = doc.new_integer(1);
    auto b     = doc.new_integer(2);
    auto c     = other.new_integer(3);
    EXPECT_TRUE(a.same_owner_as(b));
    EXPECT_FALSE(a.same_owner_as(c));
    EXPECT_EQ(a.owner(), doc);
    EXPECT_NE(c.owner(), doc);
}

TEST_F(ObjectTest, ObjectOutlivesDocumentHandle)
{
    auto page = [] {
        auto tmp = pdfgraph_test::make_document(1);
        return *tmp.pages().get_page(0);
    }();
    EXPECT_TRUE(page.is_page());
    EXPECT_EQ(page.get_page_content_data(), pdfgraph_test::page_content(1));
}
