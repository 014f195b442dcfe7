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
#include <cstdlib>
#include <sstream>
#include "svg_import_util.h"

using namespace std;

static inline bool is_digit(const string &s, size_t pos) {
    return pos < s.size() && isdigit(static_cast<unsigned char>(s[pos]));
}

/* Try to read one number token starting exactly at pos. Accepted grammar:
 *
 *   [+-]? ( digits | digits? '.' digits ) ( [eE] [+-]? digits )?
 *
 * A trailing '.' without fraction digits is not part of the token. On success pos is advanced past the token.
 */
bool svgtrace::scan_number(const string &s, size_t &pos, double &out) {
    size_t i = pos;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        i++;

    size_t int_start = i;
    while (is_digit(s, i))
        i++;
    size_t int_len = i - int_start;

    if (i < s.size() && s[i] == '.' && is_digit(s, i+1)) {
        i++;
        while (is_digit(s, i))
            i++;
    } else if (int_len == 0) {
        return false;
    }

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        size_t j = i+1;
        if (j < s.size() && (s[j] == '+' || s[j] == '-'))
            j++;
        if (is_digit(s, j)) {
            while (is_digit(s, j))
                j++;
            i = j;
        }
    }

    out = strtod(s.substr(pos, i - pos).c_str(), nullptr);
    pos = i;
    return true;
}

/* Pick every number token out of s, skipping anything in between. Garbage never stops the scan. */
vector<double> svgtrace::parse_numbers(const string &s) {
    vector<double> out;
    size_t pos = 0;
    while (pos < s.size()) {
        double val;
        if (scan_number(s, pos, val)) {
            out.push_back(val);
        } else {
            pos++;
        }
    }
    return out;
}

string svgtrace::trim(const string &s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == string::npos)
        return string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/* true -> all of s is exactly one finite number */
bool svgtrace::parse_full_number(const string &s, double &out) {
    size_t pos = 0;
    double val;
    if (!scan_number(s, pos, val) || pos != s.size())
        return false;

    if (!isfinite(val))
        return false;

    out = val;
    return true;
}

/* Parse a width/height style length. A trailing unit like "px" or "mm" is dropped without conversion. Anything that
 * does not parse yields default_value. */
double svgtrace::parse_length(const string &val, double default_value) {
    string s = trim(val);
    while (!s.empty() && isalpha(static_cast<unsigned char>(s.back())))
        s.pop_back();
    s = trim(s);

    double out;
    if (s.empty() || !parse_full_number(s, out))
        return default_value;

    return out;
}

double svgtrace::length_attr(const pugi::xml_node &node, const char *attr, double default_value) {
    const auto *val = node.attribute(attr).value();
    if (*val == '\0')
        return default_value;

    return parse_length(val, default_value);
}

/* Parse "x y w h" (comma or whitespace separated) into the extent (x, y, x+w, y+h). */
bool svgtrace::parse_viewbox(const string &val, Extent &out) {
    string s(val);
    for (auto &c : s) {
        if (c == ',')
            c = ' ';
    }

    istringstream in(s);
    vector<double> vals;
    string tok;
    while (in >> tok) {
        double d;
        if (!parse_full_number(tok, d))
            return false;
        vals.push_back(d);
    }

    if (vals.size() != 4)
        return false;

    if (vals[2] < 0.0 || vals[3] < 0.0)
        return false;

    out = Extent(vals[0], vals[1], vals[0] + vals[2], vals[1] + vals[3]);
    return true;
}
