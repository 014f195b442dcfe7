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
#include <algorithm>
#include <string>
#include <iostream>
#include <iomanip>
#include <svgtrace.hpp>
#include <clipper.hpp>
#include "svg_import_defs.h"

using namespace svgtrace;
using namespace std;

namespace {
    /* Largest coordinate magnitude clipper accepts, in clipper units */
    constexpr double clipper_max_coord = (double)0x3FFFFFFFFFFFFFFFLL;

    bool representable(const d2p &p) {
        return isfinite(p[0]) && isfinite(p[1])
            && fabs(p[0] * clipper_scale) < clipper_max_coord && fabs(p[1] * clipper_scale) < clipper_max_coord;
    }
}

SVGTraceOutput::SVGTraceOutput(ostream &out, double window_w, double window_h, int digits_frac, bool only_body)
    : StreamRenderer(out, window_w, window_h, only_body),
    m_digits_frac(digits_frac)
{
    m_batch << setprecision(m_digits_frac);
    m_fill_strokes << setprecision(m_digits_frac);
}

/* World y points up, SVG y points down */
void SVGTraceOutput::header_impl() {
    m_out << setprecision(m_digits_frac);
    m_out << "<svg width=\"" << m_window[0] << "\" height=\"" << m_window[1] << "\" viewBox=\""
        << m_world.min_x << " " << -m_world.max_y << " " << m_world.width() << " " << m_world.height()
        << "\" xmlns=\"http://www.w3.org/2000/svg\">" << endl;
}

void SVGTraceOutput::footer_impl() {
    m_out << "</svg>" << endl;
}

void SVGTraceOutput::close_polyline() {
    if (m_polyline.size() < 2) {
        m_polyline.clear();
        return;
    }

    ostream &out = target();
    out << "<polyline fill=\"none\" stroke=\"" << m_polyline_color << "\" stroke-width=\"" << m_polyline_width
        << "\" vector-effect=\"non-scaling-stroke\" stroke-linecap=\"round\" stroke-linejoin=\"round\" points=\"";
    for (size_t i=0; i<m_polyline.size(); i++) {
        if (i > 0)
            out << " ";
        out << m_polyline[i][0] << "," << -m_polyline[i][1];
    }
    out << "\"/>" << endl;
    m_polyline.clear();
}

void SVGTraceOutput::draw_line(const d2p &from, const d2p &to) {
    if (!isfinite(from[0]) || !isfinite(from[1]) || !isfinite(to[0]) || !isfinite(to[1])) {
        close_polyline();
        return;
    }

    bool continues = !m_polyline.empty() && m_polyline.back() == from
        && m_polyline_color == m_pen.stroke_color && m_polyline_width == m_pen.width;

    if (!continues) {
        close_polyline();
        m_polyline.push_back(from);
        m_polyline_color = m_pen.stroke_color;
        m_polyline_width = m_pen.width;
    }
    m_polyline.push_back(to);
}

void SVGTraceOutput::fill_started() {
    close_polyline();
    m_in_fill = true;
}

/* The fill goes below the strokes traced while it was open. Self-intersections of the traced outline are resolved
 * even-odd by clipper. */
void SVGTraceOutput::draw_fill(const Ring &outline) {
    close_polyline();
    m_in_fill = false;

    if (outline.size() >= 3 && !all_of(outline.begin(), outline.end(), representable)) {
        cerr << "Warning: Fill outline outside of representable coordinate range, not filling" << endl;

    } else if (outline.size() >= 3) {
        ClipperLib::Path path;
        for (const auto &p : outline) {
            path.push_back({
                    (ClipperLib::cInt)round(p[0] * clipper_scale),
                    (ClipperLib::cInt)round(-p[1] * clipper_scale)
            });
        }

        ClipperLib::Paths simple;
        try {
            ClipperLib::SimplifyPolygon(path, simple, ClipperLib::pftEvenOdd);
        } catch (const ClipperLib::clipperException &e) {
            cerr << "Warning: Cannot simplify fill outline: " << e.what() << ", not filling" << endl;
            simple.clear();
        }

        if (!simple.empty()) {
            m_batch << "<path fill=\"" << m_pen.fill_color << "\" fill-rule=\"evenodd\" stroke=\"none\" d=\"";
            for (const auto &poly : simple) {
                if (poly.empty())
                    continue;

                m_batch << "M " << poly[0].X / clipper_scale << " " << poly[0].Y / clipper_scale;
                for (size_t i=1; i<poly.size(); i++) {
                    m_batch << " L " << poly[i].X / clipper_scale << " " << poly[i].Y / clipper_scale;
                }
                m_batch << " Z ";
            }
            m_batch << "\"/>" << endl;
        }
    }

    m_batch << m_fill_strokes.str();
    m_fill_strokes.str("");
    m_fill_strokes.clear();
}

void SVGTraceOutput::flush_batch() {
    /* Strokes of an open fill stay back until the fill is done */
    if (!m_in_fill)
        close_polyline();
    StreamRenderer::flush_batch();
}
