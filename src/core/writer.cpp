// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <memory>
#include <stdexcept>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include "logger.h"
#include "writer.h"

namespace pdfgraph {

class CallbackProgressReporter : public QPDFWriter::ProgressReporter {
public:
    CallbackProgressReporter(std::function<void(int)> callback)
        : callback(std::move(callback))
    {
    }

    virtual ~CallbackProgressReporter() = default;

    virtual void reportProgress(int percent) override { this->callback(percent); }

private:
    std::function<void(int)> callback;
};

static std::string encryption_password(
    std::string const &password, const int encryption_level, const char *keyname)
{
    if (encryption_level > 4)
        return password;

    std::string result;
    auto success = QUtil::utf8_to_pdf_doc(password, result);
    if (!success)
        throw std::invalid_argument(std::string("Encryption level is R2/R3/R4 and ") +
                                    keyname + " password is not encodable as PDFDocEncoding");
    return result;
}

static void setup_encryption(QPDFWriter &w, Encryption const &encryption)
{
    int encryption_level = encryption.R;
    if (encryption_level < 2 || encryption_level > 6)
        throw std::invalid_argument("Invalid encryption level: must be 2, 3, 4, 5 or 6");

    if (encryption_level == 5) {
        get_pdfgraph_logger()->warn("Encryption R=5 is deprecated\n");
    }

    auto owner = encryption_password(encryption.owner, encryption_level, "owner");
    auto user  = encryption_password(encryption.user, encryption_level, "user");

    bool aes      = encryption.aes.value_or(encryption_level >= 4);
    bool metadata = encryption.metadata.value_or(encryption_level >= 4);

    if (metadata && encryption_level < 4) {
        throw std::invalid_argument("Cannot encrypt metadata when R < 4");
    }
    if (aes && encryption_level < 4) {
        throw std::invalid_argument("Cannot encrypt with AES when R < 4");
    }
    if (encryption_level == 6 && !aes) {
        throw std::invalid_argument("When R = 6, AES encryption must be enabled");
    }
    if (metadata && !aes) {
        throw std::invalid_argument(
            "Cannot encrypt metadata unless AES encryption is enabled");
    }

    auto const &allow = encryption.allow;
    qpdf_r3_print_e print;
    if (allow.print_highres)
        print = qpdf_r3p_full;
    else if (allow.print_lowres)
        print = qpdf_r3p_low;
    else
        print = qpdf_r3p_none;

    if (encryption_level == 6) {
        w.setR6EncryptionParameters(user.c_str(),
            owner.c_str(),
            allow.accessibility,
            allow.extract,
            allow.modify_assembly,
            allow.modify_annotation,
            allow.modify_form,
            allow.modify_other,
            print,
            metadata);
    } else if (encryption_level == 5) {
        w.setR5EncryptionParameters(user.c_str(),
            owner.c_str(),
            allow.accessibility,
            allow.extract,
            allow.modify_assembly,
            allow.modify_annotation,
            allow.modify_form,
            allow.modify_other,
            print,
            metadata);
    } else if (encryption_level == 4) {
        w.setR4EncryptionParametersInsecure(user.c_str(),
            owner.c_str(),
            allow.accessibility,
            allow.extract,
            allow.modify_assembly,
            allow.modify_annotation,
            allow.modify_form,
            allow.modify_other,
            print,
            metadata,
            aes);
    } else if (encryption_level == 3) {
        w.setR3EncryptionParametersInsecure(user.c_str(),
            owner.c_str(),
            allow.accessibility,
            allow.extract,
            allow.modify_assembly,
            allow.modify_annotation,
            allow.modify_form,
            allow.modify_other,
            print);
    } else if (encryption_level == 2) {
        w.setR2EncryptionParametersInsecure(user.c_str(),
            owner.c_str(),
            (print != qpdf_r3p_none),
            allow.modify_assembly,
            allow.extract,
            allow.modify_annotation);
    }
}

static qpdf_stream_data_e to_qpdf(StreamDataMode mode)
{
    switch (mode) {
    case StreamDataMode::Uncompress:
        return qpdf_s_uncompress;
    case StreamDataMode::Preserve:
        return qpdf_s_preserve;
    case StreamDataMode::Compress:
        return qpdf_s_compress;
    }
    throw std::logic_error("unknown StreamDataMode");
}

static qpdf_object_stream_e to_qpdf(ObjectStreamMode mode)
{
    switch (mode) {
    case ObjectStreamMode::Disable:
        return qpdf_o_disable;
    case ObjectStreamMode::Preserve:
        return qpdf_o_preserve;
    case ObjectStreamMode::Generate:
        return qpdf_o_generate;
    }
    throw std::logic_error("unknown ObjectStreamMode");
}

Writer::Writer(Document doc, WriterConfig config) : doc(std::move(doc)), cfg(std::move(config))
{
    validate();
}

void Writer::validate() const
{
    if (cfg.encryption) {
        if (cfg.content_normalization || cfg.decode_level) {
            throw std::invalid_argument("cannot save with encryption and "
                                        "content_normalization or decode_level");
        }
        if (cfg.preserve_encryption) {
            throw std::invalid_argument(
                "cannot both preserve encryption and apply new encryption");
        }
    }
    if (cfg.preserve_encryption && !doc.is_encrypted()) {
        throw std::invalid_argument("can't preserve encryption parameters on "
                                    "a file with no encryption");
    }
    if (cfg.extension_level < 0)
        throw std::invalid_argument("extension_level must not be negative");
    if (cfg.extension_level > 0 && cfg.pdf_version.empty())
        throw std::invalid_argument("extension_level requires pdf_version");
}

void Writer::configure(QPDFWriter &w)
{
    if (cfg.static_id) {
        w.setStaticID(true);
    }
    if (cfg.deterministic_id) {
        w.setDeterministicID(true);
    }
    w.setNewlineBeforeEndstream(cfg.newline_before_endstream);

    if (!cfg.min_version.empty()) {
        w.setMinimumPDFVersion(cfg.min_version, 0);
    }
    w.setCompressStreams(cfg.compress_streams);
    if (cfg.stream_data_mode) {
        w.setStreamDataMode(to_qpdf(*cfg.stream_data_mode));
    }
    if (cfg.decode_level) {
        // Unconditionally calling setDecodeLevel has side effects, disabling
        // preserve encryption in particular
        w.setDecodeLevel(to_qpdf(*cfg.decode_level));
    }
    w.setObjectStreamMode(to_qpdf(cfg.object_stream_mode));
    w.setRecompressFlate(cfg.recompress_flate);
    w.setPreserveUnreferencedObjects(cfg.preserve_unreferenced_objects);

    if (cfg.encryption) {
        setup_encryption(w, *cfg.encryption);
    } else {
        w.setPreserveEncryption(cfg.preserve_encryption);
    }

    w.setContentNormalization(cfg.content_normalization);
    w.setLinearization(cfg.linearize);
    w.setQDFMode(cfg.qdf);

    if (!cfg.pdf_version.empty()) {
        w.forcePDFVersion(cfg.pdf_version, cfg.extension_level);
    }

    if (cfg.progress) {
        auto reporter = std::shared_ptr<QPDFWriter::ProgressReporter>(
            new CallbackProgressReporter(cfg.progress));
        w.registerProgressReporter(reporter);
    }
}

std::string Writer::write_to_memory()
{
    std::string result;
    translate_errors([&] {
        QPDFWriter w(doc.qpdf());
        // We must set up the output pipeline before we configure encryption
        Pl_String output("pdfgraph output", nullptr, result);
        w.setOutputPipeline(&output);
        configure(w);
        w.write();
    });
    return result;
}

void Writer::write(std::string const &filename)
{
    translate_errors([&] {
        QPDFWriter w(doc.qpdf());
        w.setOutputFilename(filename.c_str());
        configure(w);
        w.write();
    });
}

} // namespace pdfgraph
