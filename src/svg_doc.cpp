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

#include <iostream>
#include <fstream>
#include <cmath>

#include <svgtrace.hpp>
#include <flatten.hpp>
#include "svg_import_util.h"
#include "svg_shapes.h"
#include "svg_transform.h"

using namespace svgtrace;
using namespace std;

bool svgtrace::SVGDocument::load(string filename, const TraceSettings &settings) {
    ifstream in_f;
    in_f.open(filename);

    return in_f && load(in_f, settings);
}

bool svgtrace::SVGDocument::load(istream &in, const TraceSettings &settings) {
    _valid = false;
    m_elements.clear();

    /* Load XML document */
    pugi::xml_document svg_doc;
    auto res = svg_doc.load(in);
    if (!res) {
        cerr << "Error: Cannot parse input file: " << res.description() << endl;
        return false;
    }

    pugi::xml_node root_elem = svg_doc.child("svg");
    if (!root_elem) {
        cerr << "Error: Input file is missing root <svg> element" << endl;
        return false;
    }

    collect_elements(root_elem, xform2d(), settings);

    string vb_attr(root_elem.attribute("viewBox").value());
    if (vb_attr.empty()) {
        vb_attr = root_elem.attribute("viewbox").value();
    }

    vector<Polygon> polys;
    for (const auto &elem : m_elements) {
        polys.push_back(elem.poly);
    }

    if (settings.fit_to_geometry) {
        m_extent = get_polygons_bounds(polys);
        m_extent_source = EXT_GEOMETRY;

    } else {
        m_extent = resolve_extent(root_elem.attribute("width").value(), root_elem.attribute("height").value(),
                vb_attr, polys, &m_extent_source);

        if (!vb_attr.empty() && m_extent_source != EXT_VIEWBOX) {
            cerr << "Warning: Invalid viewBox \"" << vb_attr << "\", ignoring" << endl;
        }

        if (m_extent_source == EXT_DEFAULT) {
            cerr << "Warning: Neither viewBox, width/height nor any drawable geometry given. Using default extent." << endl;
        }
    }

    cerr << "Info: Loaded " << m_elements.size() << " elements, extent from " << extent_source_name(m_extent_source)
        << ": " << m_extent.dbg_str() << endl;

    _valid = true;
    return true;
}

/* Recursively collect all drawable elements below the given group in document order. */
void svgtrace::SVGDocument::collect_elements(const pugi::xml_node &group, const xform2d &parent_mat,
        const TraceSettings &settings) {

    for (const auto &node : group.children()) {
        if (node.type() != pugi::node_element)
            continue;

        string name(node.name());

        if (name == "g" || name == "a" || name == "svg" || name == "switch") {
            xform2d mat;
            if (settings.inherit_group_transforms) {
                /* The group's transform applies after everything inside it */
                mat = parent_mat * parse_transform(node.attribute("transform").value());
            }
            collect_elements(node, mat, settings);

        } else if (is_geometry_element(name)) {
            load_element(node, parent_mat, settings);

        } else if (name == "defs" || name == "clipPath" || name == "mask" || name == "pattern"
                || name == "marker" || name == "symbol") {
            /* not rendered directly */

        } else if (name == "title" || name == "desc" || name == "metadata" || name == "style") {
            /* ignore */

        } else {
            cerr << "Warning: Ignoring unexpected child: <" << node.name() << ">" << endl;
        }
    }
}

void svgtrace::SVGDocument::load_element(const pugi::xml_node &node, const xform2d &mat,
        const TraceSettings &settings) {
    SVGPath path;
    if (!load_svg_geometry(node, path)) {
        cerr << "Warning: Cannot load geometry of <" << node.name() << ">, ignoring" << endl;
        return;
    }

    xform2d elem_mat = mat * parse_transform(node.attribute("transform").value());

    DocumentElement elem;
    elem.style = load_style(node);
    elem.poly = flatten_path(path, elem_mat, settings.seg_unit);
    m_elements.push_back(std::move(elem));
}
