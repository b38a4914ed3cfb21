// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#pragma once

#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace pdfgraph {

// Route from an object down through nested dictionaries and arrays, used by
// Object::get_path. Rendered as NamePath.Pages.Kids[0].
class NamePath {
public:
    // A dictionary key, always stored with its leading slash, or an array
    // index that may count from the end
    struct Step {
        Step(std::string name);
        Step(char const *name) : Step(std::string(name)) {}
        Step(int index) : index(index) {}

        bool is_name() const { return !name.empty(); }

        std::string name;
        int index = 0;
    };

    NamePath() = default;
    NamePath(std::initializer_list<Step> steps) : steps(steps) {}
    explicit NamePath(std::vector<Step> steps) : steps(std::move(steps)) {}

    NamePath join(Step step) const;

    std::vector<Step>::const_iterator begin() const { return steps.begin(); }
    std::vector<Step>::const_iterator end() const { return steps.end(); }
    size_t depth() const { return steps.size(); }
    bool is_root() const { return steps.empty(); }

    // The first n steps, as shown in error messages
    std::string prefix(size_t n) const;
    std::string to_string() const { return prefix(steps.size()); }

private:
    std::vector<Step> steps;
};

std::ostream &operator<<(std::ostream &os, NamePath const &path);

} // namespace pdfgraph
