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
#include <algorithm>

#include "svg_transform.h"
#include "svg_import_util.h"

using namespace svgtrace;
using namespace std;

TransformOp TransformOp::translate(double tx, double ty) {
    return TransformOp(XF_TRANSLATE, {tx, ty});
}

TransformOp TransformOp::scale(double sx, double sy) {
    return TransformOp(XF_SCALE, {sx, sy});
}

TransformOp TransformOp::rotate(double angle_deg) {
    return TransformOp(XF_ROTATE, {angle_deg});
}

TransformOp TransformOp::rotate(double angle_deg, double cx, double cy) {
    return TransformOp(XF_ROTATE, {angle_deg, cx, cy}, true);
}

TransformOp TransformOp::svg_matrix(double a, double b, double c, double d, double e, double f) {
    return TransformOp(XF_MATRIX, {a, b, c, d, e, f});
}

TransformOp TransformOp::from_call(const string &name, const vector<double> &args) {
    string lname(name);
    transform(lname.begin(), lname.end(), lname.begin(), [](unsigned char c){ return std::tolower(c); });

    if (lname == "translate") {
        double tx = args.size() > 0 ? args[0] : 0.0;
        double ty = args.size() > 1 ? args[1] : 0.0;
        return translate(tx, ty);

    } else if (lname == "scale") {
        double sx = args.size() > 0 ? args[0] : 1.0;
        double sy = args.size() > 1 ? args[1] : sx;
        return scale(sx, sy);

    } else if (lname == "rotate") {
        double angle = args.size() > 0 ? args[0] : 0.0;
        /* A lone cx without cy is not a center. */
        if (args.size() > 2)
            return rotate(angle, args[1], args[2]);
        return rotate(angle);

    } else if (lname == "matrix") {
        if (args.size() != 6)
            return TransformOp();
        return svg_matrix(args[0], args[1], args[2], args[3], args[4], args[5]);
    }

    /* skewX, skewY and anything else contribute nothing */
    return TransformOp();
}

xform2d TransformOp::matrix() const {
    switch (m_type) {
    case XF_TRANSLATE:
        return xform2d::translation(m_args[0], m_args[1]);

    case XF_SCALE:
        return xform2d::scaling(m_args[0], m_args[1]);

    case XF_ROTATE: {
        xform2d rot = xform2d::rotation(m_args[0] * std::numbers::pi / 180.0);
        if (!m_has_center)
            return rot;
        double cx = m_args[1], cy = m_args[2];
        return xform2d::translation(cx, cy) * rot * xform2d::translation(-cx, -cy);
    }

    case XF_MATRIX:
        return xform2d::from_svg(m_args[0], m_args[1], m_args[2], m_args[3], m_args[4], m_args[5]);

    case XF_NOOP:
        break;
    }
    return xform2d();
}

static inline bool is_word_char(char c) {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/* Split a transform list into its function calls. A call is a word, optional whitespace, "(", the argument text and
 * the next ")". Text that is not part of a call is skipped, and a call missing its closing parenthesis ends the
 * list. */
vector<TransformOp> svgtrace::tokenize_transform(const string &svg_transform) {
    vector<TransformOp> out;
    const string &s = svg_transform;

    size_t pos = 0;
    while (pos < s.size()) {
        if (!is_word_char(s[pos])) {
            pos++;
            continue;
        }

        size_t name_begin = pos;
        while (pos < s.size() && is_word_char(s[pos]))
            pos++;
        string name = s.substr(name_begin, pos - name_begin);

        size_t paren = pos;
        while (paren < s.size() && isspace(static_cast<unsigned char>(s[paren])))
            paren++;
        if (paren >= s.size() || s[paren] != '(')
            continue;

        size_t close = s.find(')', paren + 1);
        if (close == string::npos)
            break;

        string args = s.substr(paren + 1, close - paren - 1);
        out.push_back(TransformOp::from_call(name, parse_numbers(args)));
        pos = close + 1;
    }

    return out;
}

/* Fold ops in textual order, left-multiplying each onto the running matrix. The last listed op therefore ends up
 * applied outermost: p' = T_n(...T_1(p)). */
xform2d svgtrace::fold_transform(const vector<TransformOp> &ops) {
    xform2d m;
    for (const auto &op : ops) {
        m = op.matrix() * m;
    }
    return m;
}

xform2d svgtrace::parse_transform(const string &svg_transform) {
    if (trim(svg_transform).empty())
        return xform2d();

    return fold_transform(tokenize_transform(svg_transform));
}
