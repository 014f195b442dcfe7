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

#include <string>
#include <vector>

#include "geom2d.hpp"

namespace svgtrace {

    enum TransformOpType {
        XF_NOOP, /* unsupported function (skewX, skewY, ...) or unusable argument list */
        XF_TRANSLATE,
        XF_SCALE,
        XF_ROTATE,
        XF_MATRIX,
    };

    /* One function call from an SVG transform list, with its arguments already normalized. */
    class TransformOp {
    public:
        TransformOp() : m_type(XF_NOOP) {}

        static TransformOp translate(double tx, double ty=0.0);
        static TransformOp scale(double sx, double sy);
        static TransformOp scale(double s) { return scale(s, s); }
        static TransformOp rotate(double angle_deg);
        static TransformOp rotate(double angle_deg, double cx, double cy);
        static TransformOp svg_matrix(double a, double b, double c, double d, double e, double f);

        /* Map a function name and its raw numeric arguments to an op. Unknown names give XF_NOOP. */
        static TransformOp from_call(const std::string &name, const std::vector<double> &args);

        TransformOpType type() const { return m_type; }
        bool has_center() const { return m_has_center; }
        const std::vector<double> &args() const { return m_args; }

        xform2d matrix() const;

    private:
        TransformOp(TransformOpType type, std::vector<double> args, bool has_center=false)
            : m_type(type), m_args(args), m_has_center(has_center) {}

        TransformOpType m_type;
        std::vector<double> m_args;
        bool m_has_center = false;
    };

    std::vector<TransformOp> tokenize_transform(const std::string &svg_transform);
    xform2d fold_transform(const std::vector<TransformOp> &ops);
    xform2d parse_transform(const std::string &svg_transform);

} /* namespace svgtrace */
