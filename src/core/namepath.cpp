// SPDX-FileCopyrightText: 2025 James R. Barlow
// SPDX-License-Identifier: MPL-2.0

#include <algorithm>
#include <locale>
#include <sstream>

#include "namepath.h"

namespace pdfgraph {

NamePath::Step::Step(std::string name) : name(std::move(name))
{
    if (this->name.empty() || this->name[0] != '/')
        this->name.insert(0, 1, '/');
}

NamePath NamePath::join(Step step) const
{
    NamePath longer(*this);
    longer.steps.push_back(std::move(step));
    return longer;
}

std::string NamePath::prefix(size_t n) const
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << "NamePath";
    n = std::min(n, steps.size());
    for (auto it = steps.begin(); it != steps.begin() + n; ++it) {
        if (it->is_name())
            ss << '.' << it->name.substr(1);
        else
            ss << '[' << it->index << ']';
    }
    return ss.str();
}

std::ostream &operator<<(std::ostream &os, NamePath const &path)
{
    return os << path.to_string();
}

} // namespace pdfgraph
