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

#include "svg_geom.h"

#include <cmath>
#include <algorithm>

#include "svg_import_defs.h"
#include "svg_import_util.h"

using namespace svgtrace;
using namespace std;

const char *svgtrace::extent_source_name(ExtentSource src) {
    switch (src) {
    case EXT_VIEWBOX: return "viewBox";
    case EXT_PAGE_SIZE: return "width/height";
    case EXT_POLYGON_BOUNDS: return "polygon bounds";
    case EXT_DEFAULT: return "default";
    case EXT_GEOMETRY: return "flattened geometry";
    }
    return "unknown";
}

/* Running min/max over all points. Stays invalid if there are none. */
static Extent accumulate_bounds(const vector<Polygon> &polys) {
    Extent out = Extent::empty();

    for (const Polygon &poly : polys) {
        for (const Ring &ring : poly) {
            for (const d2p &p : ring) {
                out.include(p);
            }
        }
    }

    return out;
}

/* Get bounding box of a set of polygons */
Extent svgtrace::get_polygons_bounds(const vector<Polygon> &polys) {
    Extent out = accumulate_bounds(polys);

    if (!out.valid())
        return Extent::fallback();

    return out;
}

Extent svgtrace::resolve_extent(const string &width, const string &height, const string &viewbox,
        const vector<Polygon> &polys, ExtentSource *source_out) {
    ExtentSource dummy;
    ExtentSource &src = source_out ? *source_out : dummy;

    Extent vb;
    if (parse_viewbox(viewbox, vb)) {
        src = EXT_VIEWBOX;
        return vb;
    }

    double page_w = parse_length(width);
    double page_h = parse_length(height);
    if (isfinite(page_w) && isfinite(page_h) && page_w > 0.0 && page_h > 0.0) {
        src = EXT_PAGE_SIZE;
        return Extent(0.0, 0.0, page_w, page_h);
    }

    Extent bounds = accumulate_bounds(polys);
    if (bounds.valid()) {
        src = EXT_POLYGON_BOUNDS;
        return bounds;
    }

    src = EXT_DEFAULT;
    return Extent::fallback();
}

ViewMapping svgtrace::compute_view_mapping(const Extent &extent, double window_w, double window_h, double margin) {
    double vb_w = fmax(extent.width(), extent_epsilon);
    double vb_h = fmax(extent.height(), extent_epsilon);
    double ar = vb_w / vb_h;

    double win_m = fmin(window_w, window_h);
    if (!(win_m > 0.0) || !isfinite(win_m))
        win_m = 1.0;

    ViewMapping out;
    if (ar > 1.0) {
        out.window_w = win_m * ar;
        out.window_h = win_m;
    } else {
        out.window_w = win_m;
        out.window_h = win_m / ar;
    }

    double dx = vb_w * margin;
    double dy = vb_h * margin;
    out.world = Extent(
            extent.min_x - dx,
            -(extent.max_y + dy),
            extent.max_x + dx,
            -(extent.min_y - dy));

    return out;
}
