// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <stdexcept>

#include "session.h"
#include "views.h"

namespace pdfgraph {

static void range_check(size_t index, size_t size)
{
    if (index >= size)
        throw std::out_of_range("index " + std::to_string(index) +
                                " out of range for array of length " +
                                std::to_string(size));
}

Object Array::iterator::operator*() const
{
    auto item = array->get(index);
    if (!item)
        throw std::out_of_range("array iterator dereferenced past the end");
    return std::move(*item);
}

Array::Array(Object const &obj) : obj(obj.alias())
{
    this->obj.require_type(ObjectType::Array);
}

Array::Array(Object &&obj) : obj(std::move(obj))
{
    this->obj.require_type(ObjectType::Array);
}

size_t Array::size() const
{
    return static_cast<size_t>(obj.handle().getArrayNItems());
}

std::optional<Object> Array::get(size_t index) const
{
    if (index >= size())
        return std::nullopt;
    return obj.session->wrap(obj.handle().getArrayItem(static_cast<int>(index)));
}

void Array::set(size_t index, Object const &value)
{
    range_check(index, size());
    auto item = obj.session->store(value);
    translate_errors(
        [&] { obj.handle().setArrayItem(static_cast<int>(index), item); });
}

void Array::push(Object const &value)
{
    auto item = obj.session->store(value);
    translate_errors([&] { obj.handle().appendItem(item); });
}

void Array::insert(size_t index, Object const &value)
{
    if (index != size())
        range_check(index, size());
    auto item = obj.session->store(value);
    translate_errors([&] { obj.handle().insertItem(static_cast<int>(index), item); });
}

void Array::erase(size_t index)
{
    range_check(index, size());
    obj.handle().eraseItem(static_cast<int>(index));
}

std::vector<Object> Array::items() const
{
    std::vector<Object> result;
    for (auto &item : obj.handle().getArrayAsVector())
        result.push_back(obj.session->wrap(item));
    return result;
}

} // namespace pdfgraph
