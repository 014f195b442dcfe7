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

#include <vector>

#include "geom2d.hpp"
#include "svg_path.h"

namespace svgtrace {

    constexpr double default_seg_unit = 8.0;

    /* Upper bound on samples taken from a single segment, against absurd coordinates in broken input */
    constexpr size_t max_segment_samples = 1000000;

    /* Number of evenly spaced samples for a segment of the given length: max(2, ceil(length / seg_unit)) */
    size_t segment_sample_count(double length, double seg_unit);

    /* Sample one segment at evenly spaced t in [0, 1], both end points included. */
    std::vector<d2p> flatten_segment(const CurveSegment &seg, double seg_unit);

    /* Concatenate the samples of all segments of one continuous subpath and close the result by repeating its first
     * point. Adjacent segments share a duplicated end point. */
    Ring flatten_subpath(const Subpath &subpath, double seg_unit);

    /* One ring per continuous subpath, in order, with mat applied to every point. */
    Polygon flatten_path(const SVGPath &path, const xform2d &mat, double seg_unit);
}
