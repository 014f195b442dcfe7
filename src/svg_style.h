/*
 * This file is part of svgtrace, a vector image preprocessing toolchain
 * Copyright (C) 2026 The svgtrace authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pugixml.hpp>

namespace svgtrace {

    /* Style properties that matter for tracing. Unset fields were given neither as attribute nor in style. */
    class StyleAttrs {
    public:
        std::optional<std::string> fill;
        std::optional<std::string> stroke;
        std::optional<std::string> stroke_width;

        bool operator==(const StyleAttrs &other) const = default;
    };

    /* Split an inline style string into (key, value) pairs. Entries are separated by ';' and split at their first ':'.
     * Keys and values are trimmed, entries without ':' are dropped. */
    std::vector<std::pair<std::string, std::string>> parse_inline_style(const std::string &style);

    /* Overlay the entries of an inline style onto the presentation attributes, then default stroke to fill. */
    StyleAttrs merge_style(const StyleAttrs &presentation, const std::string &inline_style);

    /* merge_style() on an element's fill/stroke/stroke-width attributes and its style attribute */
    StyleAttrs load_style(const pugi::xml_node &node);

} /* namespace svgtrace */
