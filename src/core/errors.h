// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace pdfgraph {

enum class ErrorKind {
    TypeMismatch,
    Parse,
    Authentication,
    Decode,
    IO,
    ForeignObject,
    Pdf,
};

// Base class of every error raised for reasons rooted in PDF content or in
// libqpdf. Argument errors use std::invalid_argument and std::out_of_range.
class PdfError : public std::runtime_error {
public:
    explicit PdfError(std::string const &msg, ErrorKind kind = ErrorKind::Pdf)
        : std::runtime_error(msg), kind_(kind)
    {
    }
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class TypeMismatchError : public PdfError {
public:
    explicit TypeMismatchError(std::string const &msg)
        : PdfError(msg, ErrorKind::TypeMismatch)
    {
    }
};

class ParseError : public PdfError {
public:
    explicit ParseError(std::string const &msg, long long offset = -1)
        : PdfError(msg, ErrorKind::Parse), offset_(offset)
    {
    }
    // Byte offset of the problem in the parsed input, or -1 when unknown
    long long offset() const noexcept { return offset_; }

private:
    long long offset_;
};

// Missing or incorrect password for an encrypted document
class PasswordError : public PdfError {
public:
    explicit PasswordError(std::string const &msg)
        : PdfError(msg, ErrorKind::Authentication)
    {
    }
};

class DataDecodingError : public PdfError {
public:
    explicit DataDecodingError(std::string const &msg)
        : PdfError(msg, ErrorKind::Decode)
    {
    }
};

class IOError : public PdfError {
public:
    IOError(std::string const &msg, int error_number = 0)
        : PdfError(msg, ErrorKind::IO), errno_(error_number)
    {
    }
    int error_number() const noexcept { return errno_; }

private:
    int errno_;
};

class ForeignObjectError : public PdfError {
public:
    explicit ForeignObjectError(std::string const &msg)
        : PdfError(msg, ErrorKind::ForeignObject)
    {
    }
};

std::string rewrite_qpdf_logic_error_msg(std::string msg);
bool is_data_decoding_error(std::exception const &e);

// Rethrow an exception raised inside libqpdf as the matching PdfError.
// Exceptions with no PDF meaning (internal bugs) propagate unchanged.
[[noreturn]] void rethrow_translated(std::exception_ptr p);

// Run f, translating libqpdf exceptions on the way out
template <typename F>
auto translate_errors(F &&f) -> decltype(f())
{
    try {
        return std::forward<F>(f)();
    } catch (PdfError const &) {
        throw;
    } catch (std::exception const &) {
        rethrow_translated(std::current_exception());
    }
}

} // namespace pdfgraph
