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
#include <numbers>
#include <string>
#include <iostream>
#include <svgtrace.hpp>

using namespace svgtrace;
using namespace std;

void PenRenderer::set_window_size(double w, double h) {
    m_window = {w, h};
}

void PenRenderer::set_world_coordinates(const Extent &world) {
    m_world = world;
}

void PenRenderer::set_batch_size(int n) {
    /* Whatever is pending goes out under the old batch size */
    if (m_pending_ops > 0) {
        flush_batch();
        m_pending_ops = 0;
    }
    m_batch_size = max(n, 1);
}

void PenRenderer::set_pen_width(double w) {
    m_pen.width = w;
}

void PenRenderer::set_color(const string &stroke, const string &fill) {
    m_pen.stroke_color = stroke;
    m_pen.fill_color = fill;
}

void PenRenderer::pen_up() {
    m_pen.down = false;
}

void PenRenderer::pen_down() {
    m_pen.down = true;
}

void PenRenderer::move_to(d2p p) {
    d2p from = m_pen.pos;
    if (p != from) {
        m_pen.heading = atan2(p[1] - from[1], p[0] - from[0]) * 180.0 / std::numbers::pi;
    }
    m_pen.pos = p;

    if (m_pen.filling) {
        m_pen.fill_outline.push_back(p);
    }

    if (m_pen.down) {
        draw_line(from, p);
    }
    count_op();
}

void PenRenderer::stamp() {
    m_pen.stamps++;
    count_op();
}

void PenRenderer::clear_stamps() {
    m_pen.stamps = 0;
}

void PenRenderer::begin_fill() {
    m_pen.filling = true;
    m_pen.fill_outline.clear();
    m_pen.fill_outline.push_back(m_pen.pos);
    fill_started();
}

void PenRenderer::end_fill() {
    if (!m_pen.filling)
        return;

    m_pen.filling = false;
    draw_fill(m_pen.fill_outline);
    m_pen.fill_outline.clear();
    count_op();
}

void PenRenderer::finish() {
    if (m_pen.filling) {
        cerr << "Warning: Fill still open at end of drawing, closing it" << endl;
        end_fill();
    }

    if (m_pending_ops > 0) {
        flush_batch();
        m_pending_ops = 0;
    }
}

void PenRenderer::count_op() {
    m_pending_ops++;
    if (m_pending_ops >= m_batch_size) {
        flush_batch();
        m_pending_ops = 0;
    }
}

void StreamRenderer::flush_batch() {
    if (!m_header_done) {
        if (!m_only_body)
            header_impl();
        m_header_done = true;
    }

    m_out << m_batch.str();
    m_batch.str("");
    m_batch.clear();
}

void StreamRenderer::finish() {
    PenRenderer::finish();
    /* Make sure the header is out even if nothing was drawn */
    flush_batch();

    if (!m_only_body)
        footer_impl();
    m_out.flush();
}
