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

#include <memory>
#include <string>
#include <vector>

#include "geom2d.hpp"

namespace svgtrace {

    /* One parametric curve piece of a path. t runs from 0 (start) to 1 (end). */
    class CurveSegment {
    public:
        virtual ~CurveSegment() {}

        virtual d2p start() const = 0;
        virtual d2p end() const = 0;
        virtual d2p point_at(double t) const = 0;
        virtual Extent bbox() const = 0;

        /* Arc length. The default measures point_at() by adaptive chord subdivision. */
        virtual double length() const;
    };

    class LineSegment : public CurveSegment {
    public:
        LineSegment(d2p p0, d2p p1) : m_p0(p0), m_p1(p1) {}

        virtual d2p start() const { return m_p0; }
        virtual d2p end() const { return m_p1; }
        virtual d2p point_at(double t) const;
        virtual Extent bbox() const;
        virtual double length() const;

    private:
        d2p m_p0, m_p1;
    };

    class QuadraticBezier : public CurveSegment {
    public:
        QuadraticBezier(d2p p0, d2p p1, d2p p2) : m_p0(p0), m_p1(p1), m_p2(p2) {}

        virtual d2p start() const { return m_p0; }
        virtual d2p end() const { return m_p2; }
        virtual d2p point_at(double t) const;
        virtual Extent bbox() const;

        d2p control() const { return m_p1; }

    private:
        d2p m_p0, m_p1, m_p2;
    };

    class CubicBezier : public CurveSegment {
    public:
        CubicBezier(d2p p0, d2p p1, d2p p2, d2p p3) : m_p0(p0), m_p1(p1), m_p2(p2), m_p3(p3) {}

        virtual d2p start() const { return m_p0; }
        virtual d2p end() const { return m_p3; }
        virtual d2p point_at(double t) const;
        virtual Extent bbox() const;

        d2p control1() const { return m_p1; }
        d2p control2() const { return m_p2; }

    private:
        d2p m_p0, m_p1, m_p2, m_p3;
    };

    /* SVG elliptical arc, stored in center parameterization. */
    class EllipticalArc : public CurveSegment {
    public:
        EllipticalArc(d2p p0, double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p1);

        virtual d2p start() const { return m_p0; }
        virtual d2p end() const { return m_p1; }
        virtual d2p point_at(double t) const;
        virtual Extent bbox() const;

        d2p center() const { return m_center; }
        double rx() const { return m_rx; }
        double ry() const { return m_ry; }

    private:
        d2p ellipse_point(double theta) const;
        bool in_sweep(double theta) const;

        d2p m_p0, m_p1;
        double m_rx, m_ry;
        double m_phi;
        d2p m_center;
        double m_theta1, m_dtheta;
    };

    typedef std::vector<const CurveSegment *> Subpath;

    /* Segment list of one source path. Built through the *_to methods like a pen walking the outline. */
    class SVGPath {
    public:
        SVGPath() {}

        void move_to(d2p p);
        void line_to(d2p p);
        void quad_to(d2p c, d2p p);
        void cubic_to(d2p c1, d2p c2, d2p p);
        void arc_to(double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p);
        void close();

        d2p current_point() const { return m_cur; }

        const std::vector<std::unique_ptr<CurveSegment>> &segments() const { return m_segs; }
        size_t size() const { return m_segs.size(); }
        bool empty() const { return m_segs.empty(); }

        /* Split the segment list wherever one segment does not end where the next one starts. */
        std::vector<Subpath> continuous_subpaths() const;

        /* true -> out holds the union of all segment boxes. false for a path without segments. */
        bool bbox(Extent &out) const;

    private:
        std::vector<std::unique_ptr<CurveSegment>> m_segs;
        d2p m_cur = {0.0, 0.0};
        d2p m_start = {0.0, 0.0};
    };

    /* Parse SVG path data into out. Returns false if parsing stopped at a malformed token; the segments read up to
     * that point are kept. */
    bool parse_path_data(const std::string &path_data, SVGPath &out);

} /* namespace svgtrace */
