// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <stdexcept>
#include <string>

#include "errors.h"

namespace pdfgraph {

template <typename T, typename S>
inline bool str_startswith(T haystack, S needle)
{
    return std::string(haystack).rfind(needle, 0) == 0;
}

template <typename T>
inline bool str_replace(std::string &str, T from, T to)
{
    size_t start_pos = str.find(from);
    if (start_pos == std::string::npos)
        return false;
    str.replace(start_pos, std::string(from).length(), to);
    return true;
}

inline void check_dictionary_key(std::string const &key)
{
    if (key == "/")
        throw std::invalid_argument("PDF Dictionary keys may not be '/'");
    if (!str_startswith(key, "/"))
        throw std::invalid_argument("PDF Dictionary keys must begin with '/'");
}

// Bounds recursion through deeply nested or hostile object graphs
class StackGuard {
public:
    explicit StackGuard(const char *where)
    {
        if (++depth() > max_depth) {
            --depth();
            throw PdfError(std::string("maximum recursion depth exceeded in") + where);
        }
    }
    ~StackGuard() { --depth(); }
    StackGuard(StackGuard const &) = delete;
    StackGuard &operator=(StackGuard const &) = delete;

private:
    static constexpr int max_depth = 1000;
    static int &depth()
    {
        thread_local int value = 0;
        return value;
    }
};

} // namespace pdfgraph
