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

#include <array>
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <limits>
#include <algorithm>

namespace svgtrace {

    typedef std::array<double, 2> d2p;

    /* One closed polyline approximating one continuous subpath. First and last point are equal. */
    typedef std::vector<d2p> Ring;

    /* All rings produced from one source path, in subpath order. */
    typedef std::vector<Ring> Polygon;

    /* Axis-aligned logical rectangle (min_x, min_y, max_x, max_y) */
    class Extent {
        public:
            Extent() : Extent(0.0, 0.0, 0.0, 0.0) {}
            Extent(double min_x, double min_y, double max_x, double max_y) :
                min_x(min_x), min_y(min_y), max_x(max_x), max_y(max_y) {}

            /* Start value for running min/max accumulation. valid() is false until the first include(). */
            static Extent empty() {
                constexpr double inf = std::numeric_limits<double>::infinity();
                return Extent(inf, inf, -inf, -inf);
            }

            static Extent fallback() { return Extent(0.0, 0.0, 1000.0, 1000.0); }

            double width() const { return max_x - min_x; }
            double height() const { return max_y - min_y; }

            bool valid() const {
                return std::isfinite(min_x) && std::isfinite(min_y) && std::isfinite(max_x) && std::isfinite(max_y)
                    && max_x >= min_x && max_y >= min_y;
            }

            Extent &include(const d2p &p) {
                min_x = std::min(min_x, p[0]);
                min_y = std::min(min_y, p[1]);
                max_x = std::max(max_x, p[0]);
                max_y = std::max(max_y, p[1]);
                return *this;
            }

            Extent &include(const Extent &other) {
                min_x = std::min(min_x, other.min_x);
                min_y = std::min(min_y, other.min_y);
                max_x = std::max(max_x, other.max_x);
                max_y = std::max(max_y, other.max_y);
                return *this;
            }

            bool operator==(const Extent &other) const {
                return min_x == other.min_x && min_y == other.min_y && max_x == other.max_x && max_y == other.max_y;
            }

            std::string dbg_str() const {
                std::ostringstream os;
                os << "Extent< (" << min_x << ", " << min_y << ") - (" << max_x << ", " << max_y << ") >";
                return os.str();
            }

            double min_x, min_y, max_x, max_y;
    };

    /* 2D affine transform. Row layout:
     *
     *   xx xy x0
     *   yx yy y0
     *    0  0  1
     */
    class xform2d {
        public:
            xform2d(double xx, double xy, double yx, double yy, double x0=0.0, double y0=0.0) :
                xx(xx), xy(xy), x0(x0), yx(yx), yy(yy), y0(y0) {}

            xform2d() : xform2d(1.0, 0.0, 0.0, 1.0) {}

            /* SVG argument order, i.e. matrix(a, b, c, d, e, f) */
            static xform2d from_svg(double a, double b, double c, double d, double e, double f) {
                return xform2d(a, c, b, d, e, f);
            }

            static xform2d translation(double x, double y) {
                return xform2d(1, 0, 0, 1, x, y);
            }

            static xform2d scaling(double x, double y) {
                return xform2d(x, 0, 0, y);
            }

            /* theta in radians, counter-clockwise in a y-up frame */
            static xform2d rotation(double theta) {
                double s = sin(theta);
                double c = cos(theta);
                return xform2d(c, -s, s, c);
            }

            /* Matrix product. (A * B) maps p to A(B(p)). */
            xform2d operator*(const xform2d &other) const {
                xform2d out(*this);
                out.transform(other);
                return out;
            }

            /* Right-multiply other onto this, i.e. other is applied to points before this. */
            xform2d &transform(const xform2d &other) {
                double n_xx = xx * other.xx + xy * other.yx;
                double n_xy = xx * other.xy + xy * other.yy;
                double n_yx = yx * other.xx + yy * other.yx;
                double n_yy = yx * other.xy + yy * other.yy;

                double n_x0 = xx * other.x0 + xy * other.y0 + x0;
                double n_y0 = yx * other.x0 + yy * other.y0 + y0;

                xx = n_xx;
                xy = n_xy;
                yx = n_yx;
                yy = n_yy;
                x0 = n_x0;
                y0 = n_y0;

                return *this;
            }

            d2p map(const d2p &p) const {
                return d2p {
                    xx * p[0] + xy * p[1] + x0,
                    yx * p[0] + yy * p[1] + y0
                };
            }

            void transform_ring(Ring &ring) const {
                std::transform(ring.begin(), ring.end(), ring.begin(),
                        [this](const d2p &p) -> d2p {
                            return this->map(p);
                        });
            }

            bool is_identity() const {
                return xx == 1.0 && xy == 0.0 && x0 == 0.0 && yx == 0.0 && yy == 1.0 && y0 == 0.0;
            }

            bool approx_equal(const xform2d &other, double tol=1e-9) const {
                return fabs(xx - other.xx) < tol && fabs(xy - other.xy) < tol && fabs(x0 - other.x0) < tol
                    && fabs(yx - other.yx) < tol && fabs(yy - other.yy) < tol && fabs(y0 - other.y0) < tol;
            }

            /* Row-major 3x3 matrix */
            std::array<std::array<double, 3>, 3> rows() const {
                return {{ {xx, xy, x0}, {yx, yy, y0}, {0.0, 0.0, 1.0} }};
            }

            std::string dbg_str() const {
                std::ostringstream os;
                os << "xform2d< " << std::setw(5);
                os << xx << ", " << xy << ", " << x0 << " / ";
                os << yx << ", " << yy << ", " << y0;
                os << " >";
                return os.str();
            }

        private:
            double xx, xy, x0,
                   yx, yy, y0;
    };
}
