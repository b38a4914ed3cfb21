// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFLogger.hh>

#include "document.h"
#include "logger.h"
#include "pagelist.h"
#include "session.h"

namespace pdfgraph {

static void apply_open_options(Session &session, OpenOptions const &options)
{
    auto &q = session.qpdf();
    session.set_suppress_warnings(options.suppress_warnings);
    q.setPasswordIsHexKey(options.hex_password);
    q.setIgnoreXRefStreams(options.ignore_xref_streams);
    q.setAttemptRecovery(options.attempt_recovery);
}

static void finish_open(QPDF &q, OpenOptions const &options)
{
    if (options.inherit_page_attributes) {
        translate_errors([&] { q.pushInheritedAttributesToPage(); });
    }

    if (!options.password.empty() && !q.isEncrypted()) {
        get_pdfgraph_logger()->warn(
            "A password was provided, but no password was needed to open this PDF.\n");
    }
}

Document::Document(std::shared_ptr<Session> session) : session(std::move(session)) {}

Document Document::empty()
{
    auto session = std::make_shared<Session>();
    session->qpdf().emptyPDF();
    return Document(session);
}

Document Document::open(std::string const &filename, OpenOptions const &options)
{
    auto session = std::make_shared<Session>();
    auto &q      = session->qpdf();
    apply_open_options(*session, options);
    translate_errors([&] { q.processFile(filename.c_str(), options.password.c_str()); });
    finish_open(q, options);
    return Document(session);
}

Document Document::open_memory(std::string data, OpenOptions const &options)
{
    auto session = std::make_shared<Session>();
    auto &q      = session->qpdf();
    apply_open_options(*session, options);

    // qpdf reads from the buffer for as long as the document is open
    auto &buffer = session->input_buffer();
    buffer       = std::move(data);
    auto description =
        options.description.empty() ? std::string("memory buffer") : options.description;
    translate_errors([&] {
        q.processMemoryFile(description.c_str(),
            buffer.data(),
            buffer.size(),
            options.password.c_str());
    });
    finish_open(q, options);
    return Document(session);
}

QPDF &Document::qpdf() const { return session->qpdf(); }

Object Document::wrap(QPDFObjectHandle oh) const { return session->wrap(std::move(oh)); }

std::string Document::filename() const { return qpdf().getFilename(); }
std::string Document::pdf_version() const { return qpdf().getPDFVersion(); }
int Document::extension_level() const { return qpdf().getExtensionLevel(); }
bool Document::is_encrypted() const { return qpdf().isEncrypted(); }
bool Document::user_password_matched() const { return qpdf().userPasswordMatched(); }
bool Document::owner_password_matched() const { return qpdf().ownerPasswordMatched(); }

static EncryptionMethod encryption_method(QPDF::encryption_method_e method)
{
    switch (method) {
    case QPDF::e_none:
        return EncryptionMethod::None;
    case QPDF::e_rc4:
        return EncryptionMethod::RC4;
    case QPDF::e_aes:
        return EncryptionMethod::AES;
    case QPDF::e_aesv3:
        return EncryptionMethod::AESv3;
    default:
        return EncryptionMethod::Unknown;
    }
}

std::optional<EncryptionInfo> Document::encryption_info() const
{
    auto &q                                 = qpdf();
    int R                                   = 0;
    int P                                   = 0;
    int V                                   = 0;
    QPDF::encryption_method_e stream_method = QPDF::e_unknown;
    QPDF::encryption_method_e string_method = QPDF::e_unknown;
    QPDF::encryption_method_e file_method   = QPDF::e_unknown;
    if (!q.isEncrypted(R, P, V, stream_method, string_method, file_method))
        return std::nullopt;

    EncryptionInfo info;
    info.R              = R;
    info.P              = P;
    info.V              = V;
    info.stream_method  = encryption_method(stream_method);
    info.string_method  = encryption_method(string_method);
    info.file_method    = encryption_method(file_method);
    info.user_password  = q.getTrimmedUserPassword();
    info.encryption_key = q.getEncryptionKey();
    return info;
}

Permissions Document::permissions() const
{
    auto &q = qpdf();
    Permissions allow;
    allow.accessibility     = q.allowAccessibility();
    allow.extract           = q.allowExtractAll();
    allow.modify_annotation = q.allowModifyAnnotation();
    allow.modify_assembly   = q.allowModifyAssembly();
    allow.modify_form       = q.allowModifyForm();
    allow.modify_other      = q.allowModifyOther();
    allow.print_lowres      = q.allowPrintLowRes();
    allow.print_highres     = q.allowPrintHighRes();
    return allow;
}

bool Document::is_linearized() const
{
    return translate_errors([&] { return qpdf().isLinearized(); });
}

bool Document::check_linearization() const
{
    bool result = translate_errors([&] { return qpdf().checkLinearization(); });
    get_pdfgraph_logger()->info(std::string("linearization check ") +
                                (result ? "passed" : "failed") + " for " + filename() +
                                "\n");
    return result;
}

std::vector<std::string> Document::get_warnings()
{
    std::vector<std::string> warnings;
    for (auto const &w : qpdf().getWarnings())
        warnings.emplace_back(w.what());
    return warnings;
}

Dictionary Document::get_trailer() const
{
    return Dictionary(wrap(translate_errors([&] { return qpdf().getTrailer(); })));
}

Dictionary Document::get_root() const
{
    return Dictionary(wrap(translate_errors([&] { return qpdf().getRoot(); })));
}

// PDF treats a reference to a missing object as null, so an object that
// resolves to null is reported as absent
std::optional<Object> Document::get_object_by_id(int id, int generation) const
{
    auto &q = qpdf();
    if (id <= 0 || generation < 0)
        return std::nullopt;
    if (static_cast<size_t>(id) > q.getObjectCount())
        return std::nullopt;
    auto oh = translate_errors([&] { return q.getObjectByID(id, generation); });
    if (!oh.isInitialized() || oh.isNull())
        return std::nullopt;
    return wrap(oh);
}

std::vector<Object> Document::get_all_objects() const
{
    std::vector<Object> result;
    for (auto &oh : translate_errors([&] { return qpdf().getAllObjects(); }))
        result.push_back(wrap(oh));
    return result;
}

Object Document::copy_foreign(Object const &foreign)
{
    return wrap(
        translate_errors([&] { return qpdf().copyForeignObject(foreign.handle()); }));
}

void Document::replace_object(int id, int generation, Object const &replacement)
{
    auto item = session->store(replacement);
    translate_errors([&] { qpdf().replaceObject(id, generation, item); });
}

void Document::swap_objects(Object const &a, Object const &b)
{
    if (a.session != session || b.session != session)
        throw ForeignObjectError("swap_objects requires objects of this document");
    if (!a.is_indirect() || !b.is_indirect())
        throw TypeMismatchError("swap_objects requires indirect objects");
    translate_errors(
        [&] { qpdf().swapObjects(a.handle().getObjGen(), b.handle().getObjGen()); });
}

void Document::replace_reserved(Object const &reserved, Object const &replacement)
{
    if (reserved.session != session)
        throw ForeignObjectError("replace_reserved requires an object of this document");
    auto item = session->store(replacement);
    translate_errors([&] { qpdf().replaceReserved(reserved.handle(), item); });
}

PageList Document::pages() const { return PageList(*this); }

void Document::add_page(Object const &page, bool first)
{
    auto list = pages();
    if (first)
        list.insert_page(0, page);
    else
        list.append_page(page);
}

void Document::remove_page(Object const &page) { pages().remove_page(page); }

void Document::close() { qpdf().closeInputSource(); }

} // namespace pdfgraph
