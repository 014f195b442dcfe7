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

#include <iostream>
#include <string>

#include <svgtrace.hpp>
#include "svg_import_util.h"

using namespace svgtrace;
using namespace std;

namespace {

/* Move to p with the pen set to draw, leave a stamp there and restore the previous pen state. */
void head_to(Renderer &r, const d2p &p, bool draw) {
    bool was_down = r.is_down();

    if (draw)
        r.pen_down();
    else
        r.pen_up();

    r.clear_stamps();
    /* The rendering surface has its y axis pointing up */
    r.move_to({p[0], -p[1]});
    r.stamp();

    if (was_down)
        r.pen_down();
    else
        r.pen_up();
}

} /* anonymous namespace */

double svgtrace::element_pen_width(const StyleAttrs &style, double default_width) {
    if (!style.stroke_width)
        return default_width;

    constexpr double invalid = -1.0;
    double w = parse_length(*style.stroke_width, invalid);
    if (w < 0) {
        cerr << "Warning: Invalid stroke-width \"" << *style.stroke_width << "\", using default" << endl;
        return default_width;
    }
    return w;
}

void svgtrace::trace_element(Renderer &renderer, const DocumentElement &elem, const TraceSettings &settings) {
    if (elem.poly.empty() || elem.poly[0].empty())
        return;

    string fill = elem.style.fill.value_or("none");
    string stroke = elem.style.stroke.value_or("black");
    bool filled = (fill != "none");

    renderer.set_pen_width(element_pen_width(elem.style, settings.default_pen_width));
    renderer.set_color(stroke, filled ? fill : "black");

    const d2p &first = elem.poly[0][0];
    head_to(renderer, first, false);

    if (filled)
        renderer.begin_fill();

    for (size_t i=0; i<elem.poly.size(); i++) {
        const Ring &ring = elem.poly[i];
        if (ring.empty())
            continue;

        head_to(renderer, ring[0], false);
        for (size_t j=1; j<ring.size(); j++) {
            head_to(renderer, ring[j], true);
        }
        renderer.pen_up();

        /* Return to the element's start so the fill outline of every ring connects through it */
        if (i > 0)
            head_to(renderer, first, false);
    }

    if (filled)
        renderer.end_fill();
}

void svgtrace::trace_document(const SVGDocument &doc, Renderer &renderer, const TraceSettings &settings) {
    d2p win = renderer.window_size();
    ViewMapping vm = compute_view_mapping(doc.extent(), win[0], win[1], settings.margin);

    renderer.set_window_size(vm.window_w, vm.window_h);
    renderer.set_world_coordinates(vm.world);
    renderer.set_batch_size(settings.batch_size);

    for (const auto &elem : doc.elements()) {
        trace_element(renderer, elem, settings);
    }

    renderer.set_batch_size(1);
    renderer.clear_stamps();
    renderer.pen_up();
    renderer.finish();
}
