// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "object.h"

namespace pdfgraph {

/*
 * Array, Dictionary and Stream are checked views over an Object. A view made
 * from an Object refers to the same slot, so it is the same handle with a
 * narrower interface. Construction throws TypeMismatchError if the object
 * has another type.
 *
 * Values stored into a container keep the identity of indirect objects; direct
 * values are stored as snapshots.
 */

class Array {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Object;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = Object;

        iterator(Array const *array, size_t index) : array(array), index(index) {}

        Object operator*() const;
        iterator &operator++()
        {
            ++index;
            return *this;
        }
        iterator operator++(int)
        {
            auto tmp = *this;
            ++index;
            return tmp;
        }
        bool operator==(iterator const &other) const
        {
            return array == other.array && index == other.index;
        }
        bool operator!=(iterator const &other) const { return !(*this == other); }

    private:
        Array const *array;
        size_t index;
    };

    explicit Array(Object const &obj);
    explicit Array(Object &&obj);

    size_t size() const;
    bool empty() const { return size() == 0; }

    std::optional<Object> get(size_t index) const;
    void set(size_t index, Object const &value);
    void push(Object const &value);
    void insert(size_t index, Object const &value);
    void erase(size_t index);

    std::vector<Object> items() const;

    // Restartable; each pass reads the array as it is at that time
    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, size()); }

    Object const &object() const { return obj; }

private:
    Object obj;
};

class Dictionary {
public:
    explicit Dictionary(Object const &obj);
    explicit Dictionary(Object &&obj);

    std::set<std::string> keys() const;
    size_t size() const;
    bool has(std::string const &key) const;
    std::optional<Object> get(std::string const &key) const;
    // Setting a key to a direct null removes it
    void set(std::string const &key, Object const &value);
    void remove(std::string const &key);

    std::map<std::string, Object> items() const;

    Object const &object() const { return obj; }

private:
    Object obj;
};

class Stream {
public:
    explicit Stream(Object const &obj);
    explicit Stream(Object &&obj);

    // The stream's own dictionary, not a copy
    Dictionary get_stream_dictionary() const;

    std::string get_stream_data(DecodeLevel level = DecodeLevel::Generalized) const;
    std::string get_raw_stream_data() const;

    // Store unencoded data, dropping /Filter and /DecodeParms
    void replace_stream_data(std::string const &data);
    // Store data already encoded with filter and decode_parms
    void replace_stream_data(
        std::string const &data, Object const &filter, Object const &decode_parms);

    Object const &object() const { return obj; }

private:
    Object obj;
};

} // namespace pdfgraph
