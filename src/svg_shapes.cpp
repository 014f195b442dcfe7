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

#include <cmath>
#include <iostream>
#include <string>

#include "svg_import_util.h"
#include "svg_shapes.h"

using namespace svgtrace;
using namespace std;

bool svgtrace::is_geometry_element(const string &name) {
    return name == "path" || name == "rect" || name == "circle" || name == "ellipse"
        || name == "line" || name == "polyline" || name == "polygon";
}

static void load_rect(const pugi::xml_node &node, SVGPath &out) {
    double x = length_attr(node, "x");
    double y = length_attr(node, "y");
    double w = length_attr(node, "width");
    double h = length_attr(node, "height");
    if (!(w > 0.0 && h > 0.0))
        return;

    /* A single given corner radius applies to both axes */
    double rx = length_attr(node, "rx", -1.0);
    double ry = length_attr(node, "ry", -1.0);
    if (rx < 0.0)
        rx = ry;
    if (ry < 0.0)
        ry = rx;
    rx = fmin(fmax(rx, 0.0), w/2);
    ry = fmin(fmax(ry, 0.0), h/2);

    if (rx == 0.0 || ry == 0.0) {
        out.move_to({x, y});
        out.line_to({x+w, y});
        out.line_to({x+w, y+h});
        out.line_to({x, y+h});
        out.close();
        return;
    }

    out.move_to({x+rx, y});
    out.line_to({x+w-rx, y});
    out.arc_to(rx, ry, 0, false, true, {x+w, y+ry});
    out.line_to({x+w, y+h-ry});
    out.arc_to(rx, ry, 0, false, true, {x+w-rx, y+h});
    out.line_to({x+rx, y+h});
    out.arc_to(rx, ry, 0, false, true, {x, y+h-ry});
    out.line_to({x, y+ry});
    out.arc_to(rx, ry, 0, false, true, {x+rx, y});
    out.close();
}

static void load_ellipse(SVGPath &out, double cx, double cy, double rx, double ry) {
    if (!(rx > 0.0 && ry > 0.0))
        return;

    /* Two half arcs, starting at the leftmost point */
    out.move_to({cx-rx, cy});
    out.arc_to(rx, ry, 0, true, false, {cx+rx, cy});
    out.arc_to(rx, ry, 0, true, false, {cx-rx, cy});
    out.close();
}

static void load_points(const pugi::xml_node &node, SVGPath &out, bool closed) {
    vector<double> coords = parse_numbers(node.attribute("points").value());
    if (coords.size() % 2 != 0) {
        cerr << "Warning: Odd number of coordinates in points attribute of <" << node.name() << ">, dropping the last one" << endl;
        coords.pop_back();
    }

    if (coords.empty())
        return;

    out.move_to({coords[0], coords[1]});
    for (size_t i=2; i+1<coords.size(); i+=2) {
        out.line_to({coords[i], coords[i+1]});
    }

    if (closed)
        out.close();
}

bool svgtrace::load_svg_geometry(const pugi::xml_node &node, SVGPath &out) {
    string name(node.name());

    if (name == "path") {
        if (!parse_path_data(node.attribute("d").value(), out)) {
            cerr << "Warning: Truncated path data in <path> \"" << node.attribute("id").value() << "\"" << endl;
        }

    } else if (name == "rect") {
        load_rect(node, out);

    } else if (name == "circle") {
        double r = length_attr(node, "r");
        load_ellipse(out, length_attr(node, "cx"), length_attr(node, "cy"), r, r);

    } else if (name == "ellipse") {
        load_ellipse(out, length_attr(node, "cx"), length_attr(node, "cy"), length_attr(node, "rx"), length_attr(node, "ry"));

    } else if (name == "line") {
        out.move_to({length_attr(node, "x1"), length_attr(node, "y1")});
        out.line_to({length_attr(node, "x2"), length_attr(node, "y2")});

    } else if (name == "polyline") {
        load_points(node, out, false);

    } else if (name == "polygon") {
        load_points(node, out, true);

    } else {
        return false;
    }

    return true;
}
