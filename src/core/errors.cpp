// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <regex>
#include <vector>
#include <utility>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFSystemError.hh>

#include "errors.h"

namespace pdfgraph {

std::string rewrite_qpdf_logic_error_msg(std::string msg)
{
    using match_replace = std::pair<std::regex, std::string>;

    static const std::vector<match_replace> replacements = {
        match_replace{"QPDF::copyForeign(?:Object)?", "pdfgraph::Document::copy_foreign"},
        match_replace{"QPDFObjectHandle", "pdfgraph::Object"},
        match_replace{"QPDFPage(?:Object|Document)Helper", "pdfgraph::PageList"},
        match_replace{"QPDF(?!\\w)", "pdfgraph::Document"},
    };

    for (auto const &[regex, replacement] : replacements) {
        msg = std::regex_replace(msg, regex, replacement);
    }
    return msg;
}

bool is_data_decoding_error(std::exception const &e)
{
    static const std::regex decoding_error_pattern(
        "character out of range"
        "|broken end-of-data sequence in base 85 data"
        "|unexpected z during base 85 decode"
        "|TIFFPredictor created with"
        "|Pl_LZWDecoder:"
        "|Pl_Flate:"
        "|Pl_DCT:"
        "|stream inflate:"
        "|: inflate: "
        "|getStreamData",
        std::regex_constants::icase);

    return std::regex_search(e.what(), decoding_error_pattern);
}

static bool is_parse_error_code(qpdf_error_code_e code)
{
    return code == qpdf_e_damaged_pdf || code == qpdf_e_pdf;
}

void rethrow_translated(std::exception_ptr p)
{
    try {
        std::rethrow_exception(p);
    } catch (PdfError const &) {
        throw;
    } catch (QPDFExc const &e) {
        auto code = e.getErrorCode();
        if (code == qpdf_e_password)
            throw PasswordError(e.what());
        if (code == qpdf_e_system)
            throw IOError(e.what());
        if (is_data_decoding_error(e))
            throw DataDecodingError(e.what());
        if (is_parse_error_code(code))
            throw ParseError(e.what(), static_cast<long long>(e.getFilePosition()));
        throw PdfError(e.what());
    } catch (QPDFSystemError const &e) {
        throw IOError(e.what(), e.getErrno());
    } catch (std::invalid_argument const &) {
        throw;
    } catch (std::out_of_range const &) {
        throw;
    } catch (std::logic_error const &e) {
        auto msg = rewrite_qpdf_logic_error_msg(e.what());
        if (std::regex_search(msg, std::regex("copy_foreign")))
            throw ForeignObjectError(msg);
        if (std::regex_search(msg, std::regex("pdfgraph::")))
            throw PdfError(msg);
        throw;
    } catch (std::runtime_error const &e) {
        if (is_data_decoding_error(e))
            throw DataDecodingError(e.what());
        throw;
    }
}

} // namespace pdfgraph
