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
#include <numbers>
#include <cstdio>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include <flatten.hpp>
#include "svg_path.h"
#include "svg_shapes.h"

#include <minunit.h>

using namespace svgtrace;
using namespace std;

char msg[1024];

static bool near(const d2p &a, const d2p &b, double tol=1e-9) {
    return fabs(a[0] - b[0]) < tol && fabs(a[1] - b[1]) < tol;
}

static void assert_near(const d2p &expected, const d2p &actual, double tol=1e-9) {
    if (!near(expected, actual, tol)) {
        snprintf(msg, sizeof(msg), "Expected (%g, %g), got (%g, %g)", expected[0], expected[1], actual[0], actual[1]);
        mu_fail(msg);
    }
}

static void assert_rings_closed(const Polygon &poly) {
    for (const auto &ring : poly) {
        mu_assert(ring.size() >= 2, "Ring has less than two points");
        mu_assert(ring.front() == ring.back(), "Ring is not closed");
    }
}

/* Load the first element of an SVG snippet */
static bool load_snippet(const char *xml, SVGPath &out) {
    pugi::xml_document doc;
    if (!doc.load_string(xml))
        return false;
    return load_svg_geometry(doc.first_child(), out);
}

MU_TEST(test_sample_count) {
    mu_assert_int_eq(3, (int)segment_sample_count(17.0, 8.0));
    mu_assert_int_eq(2, (int)segment_sample_count(16.0, 8.0));
    mu_assert_int_eq(2, (int)segment_sample_count(1.0, 8.0));
    mu_assert_int_eq(2, (int)segment_sample_count(0.0, 8.0));
    mu_assert_int_eq(2, (int)segment_sample_count(NAN, 8.0));
    mu_assert_int_eq(13, (int)segment_sample_count(100.0, 0.0));
    mu_assert_int_eq((int)max_segment_samples, (int)segment_sample_count(1e300, 1.0));
}

MU_TEST(test_flatten_line) {
    LineSegment seg({0, 0}, {17, 0});
    auto pts = flatten_segment(seg, 8.0);
    mu_assert_int_eq(3, (int)pts.size());
    assert_near({0, 0}, pts[0]);
    assert_near({8.5, 0}, pts[1]);
    mu_check(pts[2] == seg.end());
}

MU_TEST(test_flatten_zero_length) {
    LineSegment seg({3, 4}, {3, 4});
    auto pts = flatten_segment(seg, 8.0);
    mu_assert_int_eq(2, (int)pts.size());
    mu_check(pts[0] == pts[1]);
}

MU_TEST(test_curve_lengths) {
    CubicBezier straight({0, 0}, {10, 0}, {20, 0}, {30, 0});
    mu_assert(fabs(straight.length() - 30.0) < 1e-6, "Straight cubic has wrong length");

    /* Quarter circle */
    EllipticalArc arc({10, 0}, 10, 10, 0, false, true, {0, 10});
    mu_assert(fabs(arc.length() - 5*std::numbers::pi) < 1e-6, "Quarter arc has wrong length");
    assert_near({0, 0}, arc.center());
    assert_near({10, 0}, arc.point_at(0.0));
    assert_near({0, 10}, arc.point_at(1.0));
}

MU_TEST(test_curve_bbox) {
    CubicBezier cubic({0, 0}, {0, 10}, {10, 10}, {10, 0});
    Extent box = cubic.bbox();
    mu_assert(fabs(box.max_y - 7.5) < 1e-9, "Cubic bbox misses its extremum");
    mu_assert_double_eq(0.0, box.min_x);
    mu_assert_double_eq(10.0, box.max_x);

    EllipticalArc half({-5, 0}, 5, 5, 0, false, true, {5, 0});
    box = half.bbox();
    mu_assert(fabs(box.min_y - (-5.0)) < 1e-9 || fabs(box.max_y - 5.0) < 1e-9, "Half arc bbox misses its apex");
    mu_assert(fabs(box.height() - 5.0) < 1e-9, "Half arc bbox has wrong height");
}

MU_TEST(test_ring_closure) {
    SVGPath path;
    mu_check(parse_path_data("M 0 0 C 10 0 10 10 0 10 M 20 20 L 30 20", path));

    Polygon poly = flatten_path(path, xform2d(), 8.0);
    mu_assert_int_eq(2, (int)poly.size());
    assert_rings_closed(poly);
    mu_check(poly[1][0] == (d2p{20, 20}));
    mu_assert_int_eq(3, (int)poly[1].size());
}

MU_TEST(test_flatten_applies_transform) {
    SVGPath path;
    mu_check(parse_path_data("M1 1 L2 1", path));

    Polygon poly = flatten_path(path, xform2d::translation(10, 20), 8.0);
    mu_assert_int_eq(1, (int)poly.size());
    mu_assert_int_eq(3, (int)poly[0].size());
    assert_near({11, 21}, poly[0][0]);
    assert_near({12, 21}, poly[0][1]);
    assert_near({11, 21}, poly[0][2]);
}

MU_TEST(test_path_commands) {
    SVGPath path;
    mu_check(parse_path_data("M0,0 10,0 v10 h-10 z m20 20 l5 0 0 5 Z", path));

    mu_assert_int_eq(7, (int)path.size());
    auto subpaths = path.continuous_subpaths();
    mu_assert_int_eq(2, (int)subpaths.size());
    mu_assert_int_eq(4, (int)subpaths[0].size());
    mu_assert_int_eq(3, (int)subpaths[1].size());
    assert_near({20, 20}, subpaths[1][0]->start());
    assert_near({25, 25}, subpaths[1][1]->end());
}

MU_TEST(test_path_smooth_curves) {
    SVGPath path;
    mu_check(parse_path_data("M0 0 C0 10 10 10 10 0 S20 -10 20 0 Q25 5 30 0 T40 0", path));
    mu_assert_int_eq(4, (int)path.size());

    auto *s = dynamic_cast<const CubicBezier *>(path.segments()[1].get());
    mu_assert(s != nullptr, "S did not produce a cubic");
    assert_near({10, -10}, s->control1());
    assert_near({20, -10}, s->control2());

    auto *t = dynamic_cast<const QuadraticBezier *>(path.segments()[3].get());
    mu_assert(t != nullptr, "T did not produce a quadratic");
    assert_near({35, -5}, t->control());
}

MU_TEST(test_path_arcs) {
    SVGPath path;
    /* packed flags */
    mu_check(parse_path_data("M0 0a5 5 0 1010 0", path));
    mu_assert_int_eq(1, (int)path.size());
    assert_near({10, 0}, path.segments()[0]->end());

    /* zero radius degenerates to a line, coincident end points drop the arc */
    SVGPath path2;
    mu_check(parse_path_data("M0 0 A0 5 0 0 1 10 0 A5 5 0 0 1 10 0", path2));
    mu_assert_int_eq(1, (int)path2.size());
    mu_check(dynamic_cast<const LineSegment *>(path2.segments()[0].get()) != nullptr);
}

MU_TEST(test_path_malformed) {
    SVGPath path;
    mu_check(!parse_path_data("M0 0 L10 0 L10 X 20 20", path));
    mu_assert_int_eq(1, (int)path.size());

    SVGPath path2;
    mu_check(!parse_path_data("10 10 L 20 20", path2));
    mu_check(path2.empty());

    SVGPath path3;
    mu_check(parse_path_data("", path3));
    mu_check(path3.empty());

    Extent box;
    mu_check(!path3.bbox(box));
}

MU_TEST(test_shape_rect) {
    SVGPath path;
    mu_check(load_snippet("<rect x=\"1\" y=\"2\" width=\"10\" height=\"5\"/>", path));
    mu_assert_int_eq(4, (int)path.size());

    Extent box;
    mu_check(path.bbox(box));
    mu_check(box == Extent(1, 2, 11, 7));

    SVGPath rounded;
    mu_check(load_snippet("<rect width=\"10\" height=\"10\" rx=\"2\"/>", rounded));
    mu_assert_int_eq(8, (int)rounded.size());
    mu_check(rounded.bbox(box));
    mu_assert(fabs(box.width() - 10) < 1e-9 && fabs(box.height() - 10) < 1e-9, "Rounded rect has wrong bbox");
}

MU_TEST(test_shape_circle) {
    SVGPath path;
    mu_check(load_snippet("<circle cx=\"5\" cy=\"5\" r=\"5\"/>", path));
    mu_assert_int_eq(2, (int)path.size());

    Extent box;
    mu_check(path.bbox(box));
    mu_assert(fabs(box.min_x) < 1e-9 && fabs(box.min_y) < 1e-9, "Circle bbox min wrong");
    mu_assert(fabs(box.max_x - 10) < 1e-9 && fabs(box.max_y - 10) < 1e-9, "Circle bbox max wrong");

    Polygon poly = flatten_path(path, xform2d(), 1.0);
    mu_assert_int_eq(1, (int)poly.size());
    assert_rings_closed(poly);
    for (const auto &p : poly[0]) {
        mu_assert(fabs(hypot(p[0] - 5, p[1] - 5) - 5) < 1e-6, "Circle sample off the circle");
    }
}

MU_TEST(test_shape_points) {
    SVGPath line;
    mu_check(load_snippet("<polyline points=\"0,0 10,0 10,10\"/>", line));
    mu_assert_int_eq(2, (int)line.size());

    SVGPath poly;
    mu_check(load_snippet("<polygon points=\"0,0 10,0 10,10 5\"/>", poly));
    mu_assert_int_eq(3, (int)poly.size());

    SVGPath other;
    mu_check(!load_snippet("<text>foo</text>", other));
}

MU_TEST_SUITE(flatten_suite) {
    MU_RUN_TEST(test_sample_count);
    MU_RUN_TEST(test_flatten_line);
    MU_RUN_TEST(test_flatten_zero_length);
    MU_RUN_TEST(test_curve_lengths);
    MU_RUN_TEST(test_curve_bbox);
    MU_RUN_TEST(test_ring_closure);
    MU_RUN_TEST(test_flatten_applies_transform);
    MU_RUN_TEST(test_path_commands);
    MU_RUN_TEST(test_path_smooth_curves);
    MU_RUN_TEST(test_path_arcs);
    MU_RUN_TEST(test_path_malformed);
    MU_RUN_TEST(test_shape_rect);
    MU_RUN_TEST(test_shape_circle);
    MU_RUN_TEST(test_shape_points);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(flatten_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
