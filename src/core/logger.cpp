// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "logger.h"

#include <qpdf/Pipeline.hh>

namespace pdfgraph {

// Pipeline to relay qpdf log messages to a LogHandler
// This is a sink - cannot pass to other pipeline objects
class Pl_LogHandler : public Pipeline {
public:
    Pl_LogHandler(const char *identifier, LogHandler handler, LogLevel level)
        : Pipeline(identifier, nullptr), handler(std::move(handler)), level(level)
    {
    }

    virtual ~Pl_LogHandler() = default;
    Pl_LogHandler(const Pl_LogHandler &)            = delete;
    Pl_LogHandler &operator=(const Pl_LogHandler &) = delete;

    void write(const unsigned char *buf, size_t len) override;
    void finish() override;

private:
    LogHandler handler;
    LogLevel level;
    std::string pending;
};

// qpdf writes one message in several pieces; hand over complete lines only
void Pl_LogHandler::write(const unsigned char *buf, size_t len)
{
    pending.append(reinterpret_cast<const char *>(buf), len);
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
        auto line = pending.substr(0, newline);
        pending.erase(0, newline + 1);
        handler(level, line);
    }
}

void Pl_LogHandler::finish()
{
    if (!pending.empty()) {
        handler(level, pending);
        pending.clear();
    }
}

std::shared_ptr<QPDFLogger> get_pdfgraph_logger()
{
    // All QPDFs can use the same logger
    return QPDFLogger::defaultLogger();
}

void set_log_handler(LogHandler handler)
{
    auto logger = get_pdfgraph_logger();
    if (!handler) {
        logger->setInfo(nullptr);
        logger->setWarn(nullptr);
        logger->setError(nullptr);
        return;
    }
    logger->setInfo(std::make_shared<Pl_LogHandler>(
        "qpdf to pdfgraph log handler", handler, LogLevel::Info));
    logger->setWarn(std::make_shared<Pl_LogHandler>(
        "qpdf to pdfgraph log handler", handler, LogLevel::Warning));
    logger->setError(std::make_shared<Pl_LogHandler>(
        "qpdf to pdfgraph log handler", handler, LogLevel::Error));
}

} // namespace pdfgraph
