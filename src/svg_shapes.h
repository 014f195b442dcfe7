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

#include <string>

#include <pugixml.hpp>

#include "svg_path.h"

namespace svgtrace {

bool is_geometry_element(const std::string &name);

/* Load the outline of a <path>, <rect>, <circle>, <ellipse>, <line>, <polyline> or <polygon> element. Returns false
 * for any other element. A shape with non-positive size loads as an empty path. */
bool load_svg_geometry(const pugi::xml_node &node, SVGPath &out);

} /* namespace svgtrace */
