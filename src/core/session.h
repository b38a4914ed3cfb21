// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "object.h"

namespace pdfgraph {

class Session;

// Target of one or more Object handles. Each indirect object has at most one
// live slot; direct objects get a new slot whenever a handle is issued.
struct Slot {
    Slot(QPDFObjectHandle oh, std::uint64_t serial) : oh(std::move(oh)), serial(serial)
    {
    }
    QPDFObjectHandle oh;
    const std::uint64_t serial;
};

void qpdf_basic_settings(QPDF &q);

// Silences qpdf's warning output for its lifetime
class WarningSilencer {
public:
    explicit WarningSilencer(Session &session);
    ~WarningSilencer();
    WarningSilencer(WarningSilencer const &)            = delete;
    WarningSilencer &operator=(WarningSilencer const &) = delete;

private:
    Session &session;
};

// Owns the QPDF and everything it reads from. Every Object holds a reference
// to its Session, so the graph outlives all handles into it.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session();
    ~Session();
    Session(Session const &)            = delete;
    Session &operator=(Session const &) = delete;

    QPDF &qpdf() { return *q; }
    std::shared_ptr<QPDF> const &qpdf_ptr() const { return q; }

    // qpdf has no getter for this, so it is tracked here
    void set_suppress_warnings(bool suppress);
    bool suppress_warnings() const { return suppress; }

    // Memory input must stay valid while q reads from it
    std::string &input_buffer() { return input; }

    std::shared_ptr<Slot> slot_for(QPDFObjectHandle oh);
    std::shared_ptr<Slot> new_slot(QPDFObjectHandle oh);

    // Issue a handle for oh, reusing the live slot if oh is indirect
    Object wrap(QPDFObjectHandle oh);

    // Form of value to store inside a container of this session: indirect
    // objects by reference, direct objects as a snapshot
    QPDFObjectHandle store(Object const &value);

private:
    std::string input;
    std::shared_ptr<QPDF> q;
    std::uint64_t next_serial = 1;
    bool suppress             = true;
    std::map<QPDFObjGen, std::weak_ptr<Slot>> indirect_slots;
};

} // namespace pdfgraph
