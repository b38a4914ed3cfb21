// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <qpdf/QPDFLogger.hh>

namespace pdfgraph {

enum class LogLevel { Info, Warning, Error };

using LogHandler = std::function<void(LogLevel, std::string const &)>;

// All documents share qpdf's process-wide default logger
std::shared_ptr<QPDFLogger> get_pdfgraph_logger();

// Route qpdf's info, warning and error channels to handler. Passing an empty
// handler restores qpdf's standard output and standard error defaults.
void set_log_handler(LogHandler handler);

} // namespace pdfgraph
