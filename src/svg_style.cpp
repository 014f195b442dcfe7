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

#include <string>

#include "svg_import_util.h"
#include "svg_style.h"

using namespace svgtrace;
using namespace std;

vector<pair<string, string>> svgtrace::parse_inline_style(const string &style) {
    vector<pair<string, string>> out;

    size_t pos = 0;
    while (pos <= style.size()) {
        size_t end = style.find(';', pos);
        if (end == string::npos)
            end = style.size();

        string item = style.substr(pos, end - pos);
        size_t colon = item.find(':');
        if (!item.empty() && colon != string::npos) {
            out.emplace_back(trim(item.substr(0, colon)), trim(item.substr(colon + 1)));
        }

        pos = end + 1;
    }

    return out;
}

StyleAttrs svgtrace::merge_style(const StyleAttrs &presentation, const string &inline_style) {
    StyleAttrs out(presentation);

    for (const auto &[key, value] : parse_inline_style(inline_style)) {
        if (key == "fill") {
            out.fill = value;
        } else if (key == "stroke") {
            out.stroke = value;
        } else if (key == "stroke-width") {
            out.stroke_width = value;
        }
    }

    if (!out.stroke && out.fill) {
        out.stroke = out.fill;
    }

    return out;
}

static optional<string> optional_attr(const pugi::xml_node &node, const char *name) {
    const auto *val = node.attribute(name).value();
    if (*val == '\0')
        return nullopt;
    return string(val);
}

StyleAttrs svgtrace::load_style(const pugi::xml_node &node) {
    StyleAttrs attrs;
    attrs.fill = optional_attr(node, "fill");
    attrs.stroke = optional_attr(node, "stroke");
    attrs.stroke_width = optional_attr(node, "stroke-width");

    return merge_style(attrs, node.attribute("style").value());
}
