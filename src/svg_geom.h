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

#include "geom2d.hpp"

namespace svgtrace {

    enum ExtentSource {
        EXT_VIEWBOX,
        EXT_PAGE_SIZE,
        EXT_POLYGON_BOUNDS,
        EXT_DEFAULT,
        EXT_GEOMETRY,
    };

    const char *extent_source_name(ExtentSource src);

    /* Running min/max over every point of every ring. Extent::fallback() if there are no points at all. */
    Extent get_polygons_bounds(const std::vector<Polygon> &polys);

    /* Logical document extent. First usable source wins: viewBox, then width/height (both finite and > 0), then
     * get_polygons_bounds() over the flattened and transformed polygons, then Extent::fallback(). */
    Extent resolve_extent(const std::string &width, const std::string &height, const std::string &viewbox,
            const std::vector<Polygon> &polys, ExtentSource *source_out=nullptr);

    /* World coordinate window of the rendering surface plus the window size to request from it. The world window
     * has its y axis flipped with respect to the document. */
    class ViewMapping {
    public:
        Extent world;
        double window_w;
        double window_h;
    };

    ViewMapping compute_view_mapping(const Extent &extent, double window_w, double window_h, double margin=0.02);

} /* namespace svgtrace */
