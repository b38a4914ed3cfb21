// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>

#include <qpdf/QPDFWriter.hh>

#include "document.h"

namespace pdfgraph {

enum class StreamDataMode { Uncompress, Preserve, Compress };
enum class ObjectStreamMode { Disable, Preserve, Generate };

struct Encryption {
    std::string owner;
    std::string user;
    // Revision: 2, 3, 4, 5 or 6. R2 to R4 are insecure and only useful for
    // compatibility with old readers.
    int R = 6;
    Permissions allow;
    // Default to true when R >= 4
    std::optional<bool> aes;
    std::optional<bool> metadata;
};

struct WriterConfig {
    std::string pdf_version;
    int extension_level = 0;
    std::string min_version;

    bool linearize        = false;
    bool static_id        = false;
    bool deterministic_id = false;

    bool compress_streams = true;
    std::optional<StreamDataMode> stream_data_mode;
    std::optional<DecodeLevel> decode_level;
    ObjectStreamMode object_stream_mode = ObjectStreamMode::Preserve;

    bool content_normalization         = false;
    bool preserve_unreferenced_objects = false;
    bool qdf                           = false;
    bool newline_before_endstream      = true;
    bool recompress_flate              = false;

    bool preserve_encryption = false;
    std::optional<Encryption> encryption;

    // Called with percent complete
    std::function<void(int)> progress;
};

class Writer {
public:
    Writer(Document doc, WriterConfig config);

    std::string write_to_memory();
    void write(std::string const &filename);

    WriterConfig const &config() const { return cfg; }

private:
    void validate() const;
    void configure(QPDFWriter &w);

    Document doc;
    WriterConfig cfg;
};

} // namespace pdfgraph
