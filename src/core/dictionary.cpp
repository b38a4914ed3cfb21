// SPDX-FileCopyrightText: 2022 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <stdexcept>

#include "session.h"
#include "utils.h"
#include "views.h"

namespace pdfgraph {

/*
 * PDF semantics dictate that a key whose value is null does not exist, so
 * setting a key to a direct null deletes it. An indirect null (a reference to
 * an object that does not exist) is kept.
 */

Dictionary::Dictionary(Object const &obj) : obj(obj.alias())
{
    this->obj.require_type(ObjectType::Dictionary);
}

Dictionary::Dictionary(Object &&obj) : obj(std::move(obj))
{
    this->obj.require_type(ObjectType::Dictionary);
}

std::set<std::string> Dictionary::keys() const { return obj.handle().getKeys(); }

size_t Dictionary::size() const { return keys().size(); }

bool Dictionary::has(std::string const &key) const { return obj.handle().hasKey(key); }

std::optional<Object> Dictionary::get(std::string const &key) const
{
    auto &dict = obj.handle();
    if (!dict.hasKey(key))
        return std::nullopt;
    return obj.session->wrap(dict.getKey(key));
}

void Dictionary::set(std::string const &key, Object const &value)
{
    check_dictionary_key(key);
    auto item = obj.session->store(value);
    translate_errors([&] { obj.handle().replaceKey(key, item); });
}

void Dictionary::remove(std::string const &key) { obj.handle().removeKey(key); }

std::map<std::string, Object> Dictionary::items() const
{
    std::map<std::string, Object> result;
    for (auto &[key, value] : obj.handle().getDictAsMap()) {
        if (value.isNull())
            continue;
        result.emplace(key, obj.session->wrap(value));
    }
    return result;
}

} // namespace pdfgraph
