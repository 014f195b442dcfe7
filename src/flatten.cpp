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
#include <iostream>

#include <flatten.hpp>

using namespace svgtrace;
using namespace std;

size_t svgtrace::segment_sample_count(double length, double seg_unit) {
    if (!(seg_unit > 0.0) || !isfinite(seg_unit))
        seg_unit = default_seg_unit;

    /* Zero length, or a length that could not be measured, still gets both end points */
    if (!(length > 0.0) || !isfinite(length))
        return 2;

    double n = ceil(length / seg_unit);
    if (n > (double)max_segment_samples) {
        cerr << "Warning: Segment of length " << length << " would need " << n << " samples, limiting to "
            << max_segment_samples << endl;
        return max_segment_samples;
    }

    return max((size_t)2, (size_t)n);
}

vector<d2p> svgtrace::flatten_segment(const CurveSegment &seg, double seg_unit) {
    size_t n = segment_sample_count(seg.length(), seg_unit);

    vector<d2p> out;
    out.reserve(n);
    for (size_t i=0; i<n; i++) {
        double t = (i == n-1) ? 1.0 : (double)i / (double)(n-1);
        out.push_back(seg.point_at(t));
    }
    return out;
}

Ring svgtrace::flatten_subpath(const Subpath &subpath, double seg_unit) {
    Ring ring;
    for (const auto *seg : subpath) {
        vector<d2p> pts = flatten_segment(*seg, seg_unit);
        ring.insert(ring.end(), pts.begin(), pts.end());
    }

    if (!ring.empty()) {
        d2p first = ring.front();
        ring.push_back(first);
    }
    return ring;
}

Polygon svgtrace::flatten_path(const SVGPath &path, const xform2d &mat, double seg_unit) {
    Polygon out;
    for (const auto &subpath : path.continuous_subpaths()) {
        Ring ring = flatten_subpath(subpath, seg_unit);
        mat.transform_ring(ring);
        out.push_back(ring);
    }
    return out;
}
