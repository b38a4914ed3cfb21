// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include "session.h"
#include "logger.h"
#include "utils.h"

namespace pdfgraph {

void qpdf_basic_settings(QPDF &q)
{
    q.setSuppressWarnings(true);
    q.setImmediateCopyFrom(true);
    q.setLogger(get_pdfgraph_logger());
}

Session::Session() : q(std::make_shared<QPDF>())
{
    qpdf_basic_settings(*q);
}

void Session::set_suppress_warnings(bool suppress)
{
    this->suppress = suppress;
    q->setSuppressWarnings(suppress);
}

WarningSilencer::WarningSilencer(Session &session) : session(session)
{
    session.qpdf().setSuppressWarnings(true);
}

WarningSilencer::~WarningSilencer()
{
    session.qpdf().setSuppressWarnings(session.suppress_warnings());
}

// Slots hold QPDFObjectHandles, but every slot is owned by an Object that also
// owns this Session, so none remain by the time we get here.
Session::~Session() = default;

std::shared_ptr<Slot> Session::new_slot(QPDFObjectHandle oh)
{
    return std::make_shared<Slot>(std::move(oh), next_serial++);
}

std::shared_ptr<Slot> Session::slot_for(QPDFObjectHandle oh)
{
    if (!oh.isInitialized() || !oh.isIndirect())
        return new_slot(std::move(oh));

    auto objgen = oh.getObjGen();
    auto &entry = indirect_slots[objgen];
    if (auto existing = entry.lock())
        return existing;
    auto slot = new_slot(std::move(oh));
    entry     = slot;
    return slot;
}

Object Session::wrap(QPDFObjectHandle oh)
{
    return Object(shared_from_this(), slot_for(std::move(oh)));
}

// A direct container may still reach indirect objects of another document
static void check_foreign_references(QPDFObjectHandle oh, QPDF const *owner)
{
    StackGuard sg(" store");
    if (oh.isIndirect()) {
        if (oh.getOwningQPDF() != owner)
            throw ForeignObjectError("object " + oh.getObjGen().unparse() +
                                     " belongs to another document; use "
                                     "pdfgraph::Document::copy_foreign");
        return;
    }
    if (oh.isArray()) {
        for (auto item : oh.aitems())
            check_foreign_references(item, owner);
    } else if (oh.isDictionary()) {
        for (auto item : oh.ditems())
            check_foreign_references(item.second, owner);
    }
}

QPDFObjectHandle Session::store(Object const &value)
{
    if (!value.is_initialized())
        throw TypeMismatchError("cannot store an uninitialized object");
    if (value.is_indirect()) {
        if (value.session.get() != this)
            throw ForeignObjectError("object " + value.handle().getObjGen().unparse() +
                                     " belongs to another document; use "
                                     "pdfgraph::Document::copy_foreign");
        return value.handle();
    }
    translate_errors([&] { check_foreign_references(value.handle(), q.get()); });
    return translate_errors([&] { return value.handle().shallowCopy(); });
}

} // namespace pdfgraph
