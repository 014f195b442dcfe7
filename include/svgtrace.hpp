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

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "geom2d.hpp"
#include "svg_geom.h"
#include "svg_path.h"
#include "svg_style.h"

namespace svgtrace {

    constexpr char lib_version[] = "1.0";

    /* Drawing surface driven by a pen, in the manner of a turtle graphics canvas. Coordinates passed to move_to are
     * world coordinates as set by set_world_coordinates, with y pointing up. */
    class Renderer {
        public:
            virtual ~Renderer() {}

            /* Currently available window size in pixels */
            virtual d2p window_size() const = 0;
            virtual void set_window_size(double w, double h) = 0;
            /* world.min_* is the lower left, world.max_* the upper right corner */
            virtual void set_world_coordinates(const Extent &world) = 0;
            /* Buffer this many draw operations before refreshing the output */
            virtual void set_batch_size(int n) = 0;

            virtual void set_pen_width(double w) = 0;
            virtual void set_color(const std::string &stroke, const std::string &fill) = 0;
            virtual void pen_up() = 0;
            virtual void pen_down() = 0;
            virtual bool is_down() const = 0;
            virtual void move_to(d2p p) = 0;
            virtual void stamp() = 0;
            virtual void clear_stamps() = 0;
            virtual void begin_fill() = 0;
            virtual void end_fill() = 0;

            virtual void finish() {}
    };

    class PenState {
        public:
            d2p pos = {0.0, 0.0};
            double heading = 0.0; /* degrees, counter-clockwise from +x */
            bool down = true;
            std::string stroke_color = "black";
            std::string fill_color = "black";
            double width = 1.0;
            bool filling = false;
            Ring fill_outline;
            size_t stamps = 0;
    };

    /* Renderer that keeps its own pen state and batches output. Subclasses only draw. */
    class PenRenderer : public Renderer {
        public:
            PenRenderer(double window_w=800.0, double window_h=600.0) : m_window{window_w, window_h} {}
            virtual ~PenRenderer() {}

            virtual d2p window_size() const { return m_window; }
            virtual void set_window_size(double w, double h);
            virtual void set_world_coordinates(const Extent &world);
            virtual void set_batch_size(int n);

            virtual void set_pen_width(double w);
            virtual void set_color(const std::string &stroke, const std::string &fill);
            virtual void pen_up();
            virtual void pen_down();
            virtual bool is_down() const { return m_pen.down; }
            virtual void move_to(d2p p);
            virtual void stamp();
            virtual void clear_stamps();
            virtual void begin_fill();
            virtual void end_fill();
            virtual void finish();

            const PenState &pen() const { return m_pen; }
            const Extent &world() const { return m_world; }
            int batch_size() const { return m_batch_size; }

        protected:
            virtual void draw_line(const d2p &from, const d2p &to) = 0;
            /* Called by end_fill with every position visited since begin_fill */
            virtual void draw_fill(const Ring &outline) = 0;
            virtual void fill_started() {}
            virtual void flush_batch() = 0;

            void count_op();

            PenState m_pen;
            Extent m_world = Extent(-1.0, -1.0, 1.0, 1.0);
            d2p m_window;
            int m_batch_size = 1;
            int m_pending_ops = 0;
    };

    class StreamRenderer : public PenRenderer {
        public:
            StreamRenderer(std::ostream &out, double window_w=800.0, double window_h=600.0, bool only_body=false)
                : PenRenderer(window_w, window_h), m_only_body(only_body), m_out(out) {}
            virtual ~StreamRenderer() {}
            virtual void finish();

        protected:
            virtual void flush_batch();
            virtual void header_impl() = 0;
            virtual void footer_impl() = 0;

            bool m_only_body = false;
            bool m_header_done = false;
            std::ostream &m_out;
            std::ostringstream m_batch;
    };

    /* Writes the traced drawing as an SVG document. */
    class SVGTraceOutput : public StreamRenderer {
        public:
            SVGTraceOutput(std::ostream &out, double window_w=800.0, double window_h=600.0, int digits_frac=6, bool only_body=false);
            virtual ~SVGTraceOutput() {}

        protected:
            virtual void draw_line(const d2p &from, const d2p &to);
            virtual void draw_fill(const Ring &outline);
            virtual void fill_started();
            virtual void flush_batch();
            virtual void header_impl();
            virtual void footer_impl();

        private:
            void close_polyline();
            std::ostream &target() { return m_in_fill ? m_fill_strokes : m_batch; }

            int m_digits_frac;
            bool m_in_fill = false;
            std::ostringstream m_fill_strokes;
            Ring m_polyline;
            std::string m_polyline_color;
            double m_polyline_width = 1.0;
    };

    /* Writes one text line per renderer call. For debugging. */
    class CommandLogOutput : public StreamRenderer {
        public:
            CommandLogOutput(std::ostream &out, double window_w=800.0, double window_h=600.0, int digits_frac=6, bool only_body=false);
            virtual ~CommandLogOutput() {}

            virtual void set_window_size(double w, double h);
            virtual void set_world_coordinates(const Extent &world);
            virtual void set_batch_size(int n);
            virtual void set_pen_width(double w);
            virtual void set_color(const std::string &stroke, const std::string &fill);
            virtual void pen_up();
            virtual void pen_down();
            virtual void move_to(d2p p);
            virtual void stamp();
            virtual void clear_stamps();
            virtual void begin_fill();
            virtual void end_fill();

        protected:
            virtual void draw_line(const d2p &, const d2p &) {}
            virtual void draw_fill(const Ring &) {}
            virtual void header_impl();
            virtual void footer_impl();

        private:
            std::ostream &line();
            int m_digits_frac;
    };

    class TraceSettings {
    public:
        double seg_unit = 8.0;
        int batch_size = 10;
        double margin = 0.02;
        double default_pen_width = 0.5;
        bool inherit_group_transforms = true;
        bool fit_to_geometry = false;
    };

    /* One flattened source element */
    class DocumentElement {
    public:
        Polygon poly;
        StyleAttrs style;
    };

    class SVGDocument {
        public:
            SVGDocument() : _valid(false) {}

            /* true -> load successful */
            bool load(std::istream &in, const TraceSettings &settings=TraceSettings());
            bool load(std::string filename, const TraceSettings &settings=TraceSettings());
            /* true -> load successful */
            bool valid() const { return _valid; }
            operator bool() const { return valid(); }

            /* In document order */
            const std::vector<DocumentElement> &elements() const { return m_elements; }
            const Extent &extent() const { return m_extent; }
            ExtentSource extent_source() const { return m_extent_source; }

        private:
            void collect_elements(const pugi::xml_node &group, const xform2d &parent_mat, const TraceSettings &settings);
            void load_element(const pugi::xml_node &node, const xform2d &mat, const TraceSettings &settings);

            bool _valid;
            std::vector<DocumentElement> m_elements;
            Extent m_extent = Extent::fallback();
            ExtentSource m_extent_source = EXT_DEFAULT;
    };

    /* Pen width for an element: its stroke-width if that parses, else default_width */
    double element_pen_width(const StyleAttrs &style, double default_width);

    /* Draw one element: outline every ring with the pen, filling the whole element unless its fill is "none". */
    void trace_element(Renderer &renderer, const DocumentElement &elem, const TraceSettings &settings);

    /* Set up the renderer's window and world coordinates for the document extent, then trace all elements in
     * document order. */
    void trace_document(const SVGDocument &doc, Renderer &renderer, const TraceSettings &settings);
}
