// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <cerrno>

#include <gtest/gtest.h>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFSystemError.hh>

#include "helpers.h"

using namespace pdfgraph;

namespace {

template <typename E>
void translated(E const &e)
{
    translate_errors([&]() -> int { throw e; });
}

} // namespace

TEST(Errors, PasswordError)
{
    QPDFExc e(qpdf_e_password, "file.pdf", "", 0, "invalid password");
    EXPECT_THROW(translated(e), PasswordError);
}

TEST(Errors, ParseErrorHasOffset)
{
    QPDFExc e(qpdf_e_damaged_pdf, "file.pdf", "object 3 0", 42, "unexpected dictionary close token");
    try {
        translated(e);
        FAIL() << "expected ParseError";
    } catch (ParseError const &err) {
        EXPECT_EQ(err.offset(), 42);
        EXPECT_EQ(err.kind(), ErrorKind::Parse);
        EXPECT_NE(std::string(err.what()).find("unexpected dictionary close token"),
            std::string::npos);
    }
}

TEST(Errors, OtherQpdfExcIsPdfError)
{
    QPDFExc e(qpdf_e_unsupported, "file.pdf", "", 0, "unsupported feature");
    try {
        translated(e);
        FAIL() << "expected PdfError";
    } catch (PdfError const &err) {
        EXPECT_EQ(err.kind(), ErrorKind::Pdf);
    }
}

TEST(Errors, SystemErrorIsIOError)
{
    QPDFSystemError e("open missing.pdf", ENOENT);
    try {
        translated(e);
        FAIL() << "expected IOError";
    } catch (IOError const &err) {
        EXPECT_EQ(err.error_number(), ENOENT);
    }
}

TEST(Errors, CopyForeignLogicError)
{
    std::logic_error e("QPDF::copyForeign called with object from this QPDF");
    try {
        translated(e);
        FAIL() << "expected ForeignObjectError";
    } catch (ForeignObjectError const &err) {
        EXPECT_EQ(std::string(err.what()),
            "pdfgraph::Document::copy_foreign called with object from this "
            "pdfgraph::Document");
    }
}

TEST(Errors, UnrelatedLogicErrorPassesThrough)
{
    std::logic_error e("something internal");
    try {
        translated(e);
        FAIL() << "expected logic_error";
    } catch (PdfError const &) {
        FAIL() << "should not be translated";
    } catch (std::logic_error const &err) {
        EXPECT_STREQ(err.what(), "something internal");
    }
}

TEST(Errors, DecodingErrors)
{
    std::runtime_error inflate("stream inflate: inflate: data: incorrect header check");
    EXPECT_THROW(translated(inflate), DataDecodingError);

    std::runtime_error other("nothing to do with decoding");
    try {
        translated(other);
        FAIL() << "expected runtime_error";
    } catch (PdfError const &) {
        FAIL() << "should not be translated";
    } catch (std::runtime_error const &err) {
        EXPECT_STREQ(err.what(), "nothing to do with decoding");
    }
}

TEST(Errors, ArgumentErrorsPassThrough)
{
    EXPECT_THROW(translated(std::invalid_argument("bad")), std::invalid_argument);
    EXPECT_THROW(translated(std::out_of_range("far")), std::out_of_range);
}

TEST(Errors, RewriteMessages)
{
    EXPECT_EQ(rewrite_qpdf_logic_error_msg("QPDFObjectHandle::getIntValue"),
        "pdfgraph::Object::getIntValue");
    EXPECT_EQ(rewrite_qpdf_logic_error_msg("QPDF::copyForeignObject failed"),
        "pdfgraph::Document::copy_foreign failed");
    EXPECT_EQ(rewrite_qpdf_logic_error_msg("QPDFPageDocumentHelper::addPage"),
        "pdfgraph::PageList::addPage");
    EXPECT_EQ(rewrite_qpdf_logic_error_msg("QPDFWriter"), "QPDFWriter");
}

TEST(Utilities, FlateCompressionLevel)
{
    EXPECT_EQ(set_flate_compression_level(9), 9);
    EXPECT_EQ(set_flate_compression_level(-1), -1);
    EXPECT_THROW(set_flate_compression_level(10), std::invalid_argument);
    EXPECT_THROW(set_flate_compression_level(-2), std::invalid_argument);
}

TEST(Utilities, PdfDocEncoding)
{
    auto [ok, encoded] = utf8_to_pdf_doc("caf\xc3\xa9");
    EXPECT_TRUE(ok);
    EXPECT_EQ(encoded, "caf\xe9");
    EXPECT_EQ(pdf_doc_to_utf8(encoded), "caf\xc3\xa9");

    auto [fits, replaced] = utf8_to_pdf_doc("\xe6\x97\xa5", '*');
    EXPECT_FALSE(fits);
    EXPECT_EQ(replaced, "*");
}

TEST(Utilities, QpdfVersion)
{
    auto version = qpdf_version();
    ASSERT_FALSE(version.empty());
    EXPECT_GE(std::stoi(version.substr(0, version.find('.'))), 11);
}
