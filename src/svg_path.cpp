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
#include <cctype>
#include <numbers>
#include <iostream>

#include "svg_import_defs.h"
#include "svg_import_util.h"
#include "svg_path.h"

using namespace svgtrace;
using namespace std;

static inline double distance(const d2p &a, const d2p &b) {
    return hypot(b[0] - a[0], b[1] - a[1]);
}

static double length_worker(const CurveSegment &seg, double t0, const d2p &p0, double t1, const d2p &p1, unsigned level) {
    double tm = (t0 + t1) / 2;
    d2p pm = seg.point_at(tm);

    double chord = distance(p0, p1);
    double halves = distance(p0, pm) + distance(pm, p1);

    if (level >= curve_recursion_limit || halves - chord <= 1e-9 * fmax(halves, 1.0)) {
        /* Richardson step on the two chord estimates */
        return halves + (halves - chord) / 3.0;
    }

    return length_worker(seg, t0, p0, tm, pm, level + 1) + length_worker(seg, tm, pm, t1, p1, level + 1);
}

double CurveSegment::length() const {
    /* Start from a few fixed pieces so symmetric curves whose midpoint sits on the chord are not mistaken for lines */
    constexpr int initial_pieces = 8;

    double len = 0.0;
    d2p prev = point_at(0.0);
    for (int i=1; i<=initial_pieces; i++) {
        double t0 = (double)(i-1) / initial_pieces;
        double t1 = (double)i / initial_pieces;
        d2p p = point_at(t1);
        len += length_worker(*this, t0, prev, t1, p, 0);
        prev = p;
    }
    return len;
}

d2p LineSegment::point_at(double t) const {
    return d2p {
        m_p0[0] + (m_p1[0] - m_p0[0]) * t,
        m_p0[1] + (m_p1[1] - m_p0[1]) * t
    };
}

Extent LineSegment::bbox() const {
    return Extent::empty().include(m_p0).include(m_p1);
}

double LineSegment::length() const {
    return distance(m_p0, m_p1);
}

d2p QuadraticBezier::point_at(double t) const {
    double mt = 1.0 - t;
    double a = mt*mt, b = 2*mt*t, c = t*t;
    return d2p {
        a*m_p0[0] + b*m_p1[0] + c*m_p2[0],
        a*m_p0[1] + b*m_p1[1] + c*m_p2[1]
    };
}

Extent QuadraticBezier::bbox() const {
    Extent out = Extent::empty().include(m_p0).include(m_p2);

    /* B'(t) = 0 per axis */
    for (int axis=0; axis<2; axis++) {
        double den = m_p0[axis] - 2*m_p1[axis] + m_p2[axis];
        if (den == 0.0)
            continue;

        double t = (m_p0[axis] - m_p1[axis]) / den;
        if (t > 0.0 && t < 1.0)
            out.include(point_at(t));
    }
    return out;
}

d2p CubicBezier::point_at(double t) const {
    double mt = 1.0 - t;
    double a = mt*mt*mt, b = 3*mt*mt*t, c = 3*mt*t*t, d = t*t*t;
    return d2p {
        a*m_p0[0] + b*m_p1[0] + c*m_p2[0] + d*m_p3[0],
        a*m_p0[1] + b*m_p1[1] + c*m_p2[1] + d*m_p3[1]
    };
}

Extent CubicBezier::bbox() const {
    Extent out = Extent::empty().include(m_p0).include(m_p3);

    for (int axis=0; axis<2; axis++) {
        /* B'(t)/3 = a t^2 + b t + c */
        double a = -m_p0[axis] + 3*m_p1[axis] - 3*m_p2[axis] + m_p3[axis];
        double b = 2*(m_p0[axis] - 2*m_p1[axis] + m_p2[axis]);
        double c = m_p1[axis] - m_p0[axis];

        double roots[2];
        int num_roots = 0;
        if (fabs(a) < 1e-12) {
            if (b != 0.0)
                roots[num_roots++] = -c / b;

        } else {
            double disc = b*b - 4*a*c;
            if (disc >= 0.0) {
                double sq = sqrt(disc);
                roots[num_roots++] = (-b + sq) / (2*a);
                roots[num_roots++] = (-b - sq) / (2*a);
            }
        }

        for (int i=0; i<num_roots; i++) {
            if (roots[i] > 0.0 && roots[i] < 1.0)
                out.include(point_at(roots[i]));
        }
    }
    return out;
}

/* Endpoint to center parameterization conversion, cf. SVG 1.1 appendix F.6.5 and F.6.6 */
EllipticalArc::EllipticalArc(d2p p0, double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p1)
    : m_p0(p0), m_p1(p1), m_rx(fabs(rx)), m_ry(fabs(ry)), m_phi(rotation_deg * std::numbers::pi / 180.0)
{
    double cos_phi = cos(m_phi), sin_phi = sin(m_phi);

    double dx2 = (p0[0] - p1[0]) / 2, dy2 = (p0[1] - p1[1]) / 2;
    double x1p =  cos_phi * dx2 + sin_phi * dy2;
    double y1p = -sin_phi * dx2 + cos_phi * dy2;

    /* Scale up radii that are too small to span both endpoints */
    double lambda = (x1p*x1p) / (m_rx*m_rx) + (y1p*y1p) / (m_ry*m_ry);
    if (lambda > 1.0) {
        m_rx *= sqrt(lambda);
        m_ry *= sqrt(lambda);
    }

    double rx2 = m_rx*m_rx, ry2 = m_ry*m_ry;
    double num = rx2*ry2 - rx2*y1p*y1p - ry2*x1p*x1p;
    double den = rx2*y1p*y1p + ry2*x1p*x1p;
    double coef = (den == 0.0) ? 0.0 : sqrt(fmax(0.0, num / den));
    if (large_arc == sweep)
        coef = -coef;

    double cxp =  coef * m_rx * y1p / m_ry;
    double cyp = -coef * m_ry * x1p / m_rx;

    m_center = d2p {
        cos_phi * cxp - sin_phi * cyp + (p0[0] + p1[0]) / 2,
        sin_phi * cxp + cos_phi * cyp + (p0[1] + p1[1]) / 2
    };

    m_theta1 = atan2((y1p - cyp) / m_ry, (x1p - cxp) / m_rx);
    double theta2 = atan2((-y1p - cyp) / m_ry, (-x1p - cxp) / m_rx);
    m_dtheta = theta2 - m_theta1;

    if (sweep && m_dtheta < 0)
        m_dtheta += 2*std::numbers::pi;
    else if (!sweep && m_dtheta > 0)
        m_dtheta -= 2*std::numbers::pi;
}

d2p EllipticalArc::ellipse_point(double theta) const {
    double cos_phi = cos(m_phi), sin_phi = sin(m_phi);
    double ct = cos(theta), st = sin(theta);
    return d2p {
        m_center[0] + m_rx * cos_phi * ct - m_ry * sin_phi * st,
        m_center[1] + m_rx * sin_phi * ct + m_ry * cos_phi * st
    };
}

d2p EllipticalArc::point_at(double t) const {
    /* Pin the end points so rings close exactly */
    if (t <= 0.0)
        return m_p0;
    if (t >= 1.0)
        return m_p1;

    return ellipse_point(m_theta1 + t * m_dtheta);
}

bool EllipticalArc::in_sweep(double theta) const {
    constexpr double tau = 2*std::numbers::pi;
    double d = (m_dtheta >= 0) ? (theta - m_theta1) : (m_theta1 - theta);
    d = fmod(d, tau);
    if (d < 0)
        d += tau;
    return d <= fabs(m_dtheta);
}

Extent EllipticalArc::bbox() const {
    Extent out = Extent::empty().include(m_p0).include(m_p1);

    double cos_phi = cos(m_phi), sin_phi = sin(m_phi);
    /* Angles where dx/dtheta resp. dy/dtheta vanish, plus their opposites */
    double theta_x = atan2(-m_ry * sin_phi, m_rx * cos_phi);
    double theta_y = atan2(m_ry * cos_phi, m_rx * sin_phi);

    for (double theta : {theta_x, theta_x + std::numbers::pi, theta_y, theta_y + std::numbers::pi}) {
        if (in_sweep(theta))
            out.include(ellipse_point(theta));
    }
    return out;
}

void SVGPath::move_to(d2p p) {
    m_cur = p;
    m_start = p;
}

void SVGPath::line_to(d2p p) {
    m_segs.emplace_back(make_unique<LineSegment>(m_cur, p));
    m_cur = p;
}

void SVGPath::quad_to(d2p c, d2p p) {
    m_segs.emplace_back(make_unique<QuadraticBezier>(m_cur, c, p));
    m_cur = p;
}

void SVGPath::cubic_to(d2p c1, d2p c2, d2p p) {
    m_segs.emplace_back(make_unique<CubicBezier>(m_cur, c1, c2, p));
    m_cur = p;
}

void SVGPath::arc_to(double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p) {
    /* Zero-length arcs are dropped, zero-radius arcs are straight lines */
    if (p == m_cur)
        return;

    if (rx == 0.0 || ry == 0.0) {
        line_to(p);
        return;
    }

    m_segs.emplace_back(make_unique<EllipticalArc>(m_cur, rx, ry, rotation_deg, large_arc, sweep, p));
    m_cur = p;
}

void SVGPath::close() {
    if (m_cur != m_start)
        line_to(m_start);
    m_cur = m_start;
}

vector<Subpath> SVGPath::continuous_subpaths() const {
    vector<Subpath> out;
    for (const auto &seg : m_segs) {
        if (out.empty() || out.back().back()->end() != seg->start()) {
            out.emplace_back();
        }
        out.back().push_back(seg.get());
    }
    return out;
}

bool SVGPath::bbox(Extent &out) const {
    if (m_segs.empty())
        return false;

    Extent box = Extent::empty();
    for (const auto &seg : m_segs) {
        box.include(seg->bbox());
    }

    if (!box.valid())
        return false;

    out = box;
    return true;
}

namespace {

/* Token reader for SVG path data */
class PathDataLexer {
public:
    PathDataLexer(const string &data) : m_data(data), m_pos(0) {}

    void skip_separators() {
        while (m_pos < m_data.size() && (isspace(static_cast<unsigned char>(m_data[m_pos])) || m_data[m_pos] == ','))
            m_pos++;
    }

    bool at_end() {
        skip_separators();
        return m_pos >= m_data.size();
    }

    bool at_alpha() {
        skip_separators();
        return m_pos < m_data.size() && isalpha(static_cast<unsigned char>(m_data[m_pos]));
    }

    char take() { return m_data[m_pos++]; }

    bool number(double &out) {
        skip_separators();
        return scan_number(m_data, m_pos, out);
    }

    bool point(d2p &out) {
        return number(out[0]) && number(out[1]);
    }

    /* Arc flags may be packed without separators ("a1 1 0 00 1 1") */
    bool flag(bool &out) {
        skip_separators();
        if (m_pos >= m_data.size())
            return false;
        char c = m_data[m_pos];
        if (c != '0' && c != '1')
            return false;
        out = (c == '1');
        m_pos++;
        return true;
    }

    size_t pos() const { return m_pos; }

private:
    const string &m_data;
    size_t m_pos;
};

d2p reflect(const d2p &ctrl, const d2p &about) {
    return d2p { 2*about[0] - ctrl[0], 2*about[1] - ctrl[1] };
}

} /* anonymous namespace */

bool svgtrace::parse_path_data(const string &path_data, SVGPath &out) {
    PathDataLexer lex(path_data);

    char cmd = '\0';
    char prev = '\0';
    d2p last_ctrl = out.current_point();

    while (!lex.at_end()) {
        if (lex.at_alpha()) {
            size_t where = lex.pos();
            cmd = lex.take();
            if (string("MmLlHhVvCcSsQqTtAaZz").find(cmd) == string::npos) {
                cerr << "Warning: Invalid path command '" << cmd << "' at offset " << where << ", ignoring rest of path" << endl;
                return false;
            }

        } else if (cmd == '\0' || cmd == 'Z' || cmd == 'z') {
            cerr << "Warning: Unexpected path parameter at offset " << lex.pos() << ", ignoring rest of path" << endl;
            return false;
        }

        bool rel = islower(static_cast<unsigned char>(cmd));
        d2p cur = out.current_point();
        d2p off = rel ? cur : d2p{0.0, 0.0};
        bool ok = true;

        switch (toupper(static_cast<unsigned char>(cmd))) {
        case 'M': {
            d2p p;
            ok = lex.point(p);
            if (ok) {
                out.move_to({p[0] + off[0], p[1] + off[1]});
                /* Further coordinate pairs are implicit line-tos */
                cmd = rel ? 'l' : 'L';
            }
            break;
        }

        case 'L': {
            d2p p;
            ok = lex.point(p);
            if (ok)
                out.line_to({p[0] + off[0], p[1] + off[1]});
            break;
        }

        case 'H': {
            double x;
            ok = lex.number(x);
            if (ok)
                out.line_to({x + off[0], cur[1]});
            break;
        }

        case 'V': {
            double y;
            ok = lex.number(y);
            if (ok)
                out.line_to({cur[0], y + off[1]});
            break;
        }

        case 'C': {
            d2p c1, c2, p;
            ok = lex.point(c1) && lex.point(c2) && lex.point(p);
            if (ok) {
                c1 = {c1[0] + off[0], c1[1] + off[1]};
                c2 = {c2[0] + off[0], c2[1] + off[1]};
                out.cubic_to(c1, c2, {p[0] + off[0], p[1] + off[1]});
                last_ctrl = c2;
            }
            break;
        }

        case 'S': {
            d2p c2, p;
            ok = lex.point(c2) && lex.point(p);
            if (ok) {
                d2p c1 = (prev == 'C' || prev == 'S') ? reflect(last_ctrl, cur) : cur;
                c2 = {c2[0] + off[0], c2[1] + off[1]};
                out.cubic_to(c1, c2, {p[0] + off[0], p[1] + off[1]});
                last_ctrl = c2;
            }
            break;
        }

        case 'Q': {
            d2p c, p;
            ok = lex.point(c) && lex.point(p);
            if (ok) {
                c = {c[0] + off[0], c[1] + off[1]};
                out.quad_to(c, {p[0] + off[0], p[1] + off[1]});
                last_ctrl = c;
            }
            break;
        }

        case 'T': {
            d2p p;
            ok = lex.point(p);
            if (ok) {
                d2p c = (prev == 'Q' || prev == 'T') ? reflect(last_ctrl, cur) : cur;
                out.quad_to(c, {p[0] + off[0], p[1] + off[1]});
                last_ctrl = c;
            }
            break;
        }

        case 'A': {
            double rx, ry, rot;
            bool large_arc, sweep;
            d2p p;
            ok = lex.number(rx) && lex.number(ry) && lex.number(rot)
                && lex.flag(large_arc) && lex.flag(sweep) && lex.point(p);
            if (ok)
                out.arc_to(rx, ry, rot, large_arc, sweep, {p[0] + off[0], p[1] + off[1]});
            break;
        }

        case 'Z':
            out.close();
            break;
        }

        if (!ok) {
            cerr << "Warning: Malformed parameters for path command '" << cmd << "' at offset " << lex.pos() << ", ignoring rest of path" << endl;
            return false;
        }

        prev = toupper(static_cast<unsigned char>(cmd));
    }

    return true;
}
