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
#include <vector>

#include <pugixml.hpp>

#include "geom2d.hpp"

namespace svgtrace {

bool scan_number(const std::string &s, size_t &pos, double &out);
std::vector<double> parse_numbers(const std::string &s);
bool parse_full_number(const std::string &s, double &out);
double parse_length(const std::string &val, double default_value=0.0);
double length_attr(const pugi::xml_node &node, const char *attr, double default_value=0.0);
bool parse_viewbox(const std::string &val, Extent &out);
std::string trim(const std::string &s);

} /* namespace svgtrace */
