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
#include <iostream>
#include <iomanip>
#include <svgtrace.hpp>

using namespace svgtrace;
using namespace std;

CommandLogOutput::CommandLogOutput(ostream &out, double window_w, double window_h, int digits_frac, bool only_body)
    : StreamRenderer(out, window_w, window_h, only_body),
    m_digits_frac(digits_frac)
{
    m_batch << setprecision(m_digits_frac);
}

ostream &CommandLogOutput::line() {
    return m_batch;
}

void CommandLogOutput::header_impl() {
    m_out << "# svgtrace " << lib_version << " command log" << endl;
}

void CommandLogOutput::footer_impl() {
    m_out << "# end" << endl;
}

void CommandLogOutput::set_window_size(double w, double h) {
    StreamRenderer::set_window_size(w, h);
    line() << "window " << w << " " << h << endl;
}

void CommandLogOutput::set_world_coordinates(const Extent &world) {
    StreamRenderer::set_world_coordinates(world);
    line() << "world " << world.min_x << " " << world.min_y << " " << world.max_x << " " << world.max_y << endl;
}

void CommandLogOutput::set_batch_size(int n) {
    StreamRenderer::set_batch_size(n);
    line() << "batch " << n << endl;
}

void CommandLogOutput::set_pen_width(double w) {
    StreamRenderer::set_pen_width(w);
    line() << "width " << w << endl;
}

void CommandLogOutput::set_color(const string &stroke, const string &fill) {
    StreamRenderer::set_color(stroke, fill);
    line() << "color " << stroke << " " << fill << endl;
}

void CommandLogOutput::pen_up() {
    StreamRenderer::pen_up();
    line() << "up" << endl;
}

void CommandLogOutput::pen_down() {
    StreamRenderer::pen_down();
    line() << "down" << endl;
}

void CommandLogOutput::move_to(d2p p) {
    /* Logged before the base class gets a chance to flush */
    line() << "move " << p[0] << " " << p[1] << (m_pen.down ? " draw" : "") << endl;
    StreamRenderer::move_to(p);
}

void CommandLogOutput::stamp() {
    line() << "stamp" << endl;
    StreamRenderer::stamp();
}

void CommandLogOutput::clear_stamps() {
    StreamRenderer::clear_stamps();
    line() << "clear_stamps" << endl;
}

void CommandLogOutput::begin_fill() {
    StreamRenderer::begin_fill();
    line() << "begin_fill" << endl;
}

void CommandLogOutput::end_fill() {
    line() << "end_fill " << m_pen.fill_outline.size() << endl;
    StreamRenderer::end_fill();
}
