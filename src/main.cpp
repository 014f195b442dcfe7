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

#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <memory>
#include <algorithm>
#include <argagg/argagg.hpp>

#include <svgtrace.hpp>

using namespace std;
using namespace svgtrace;

namespace {

/* "800x600" -> (800, 600) */
bool parse_window_size(const string &s, double &w, double &h) {
    size_t sep = s.find_first_of("xX");
    if (sep == string::npos)
        return false;

    char *end;
    string ws = s.substr(0, sep), hs = s.substr(sep+1);
    w = strtod(ws.c_str(), &end);
    if (ws.empty() || *end)
        return false;
    h = strtod(hs.c_str(), &end);
    if (hs.empty() || *end)
        return false;

    return w > 0 && h > 0;
}

} /* anonymous namespace */

int main(int argc, char **argv) {
    argagg::parser argparser {{
            {"help", {"-h", "--help"},
                "Print help and exit",
                0},
            {"version", {"-v", "--version"},
                "Print version and exit",
                0},
            {"ofmt", {"-o", "--format"},
                "Output format. Supported: svg (traced drawing), log (renderer command log)",
                1},
            {"seg_unit", {"-s", "--seg-unit"},
                "Target distance between sampled points along curves, in document units (default: 8)",
                1},
            {"batch_size", {"-b", "--batch-size"},
                "Number of draw operations buffered before output is flushed (default: 10)",
                1},
            {"window", {"-w", "--window"},
                "Window size to fit the drawing into, as WIDTHxHEIGHT (default: 800x600)",
                1},
            {"margin", {"-m", "--margin"},
                "Margin around the drawing as a fraction of its size (default: 0.02)",
                1},
            {"precision", {"-p", "--precision"},
                "Number of significant digits for exported coordinates (default: 6)",
                1},
            {"pen_width", {"--pen-width"},
                "Pen width for elements without a usable stroke-width (default: 0.5)",
                1},
            {"fit_geometry", {"--fit-geometry"},
                "Ignore the document's declared size and viewBox and fit the view to the drawn geometry",
                0},
            {"no_group_transforms", {"--no-group-transforms"},
                "Only apply each element's own transform, ignoring transforms of enclosing groups",
                0},
            {"no_header", {"--no-header"},
                "Do not export output format header/footer, only export the drawing itself",
                0},
    }};


    ostringstream usage;
    usage
        << argv[0] << " " << lib_version << endl
        << endl
        << "Usage: " << argv[0] << " [options]... [input_file] [output_file]" << endl
        << endl
        << "Input defaults to \"input.svg\". Specify \"-\" for stdin/stdout." << endl
        << endl;

    argagg::parser_results args;
    try {
        args = argparser.parse(argc, argv);
    } catch (const std::exception& e) {
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser << '\n'
            << "Encountered exception while parsing arguments: " << e.what()
            << '\n';
        return EXIT_FAILURE;
    }

    if (args["help"]) {
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_SUCCESS;
    }

    if (args["version"]) {
        cerr << lib_version << endl;
        return EXIT_SUCCESS;
    }

    TraceSettings settings;
    double window_w = 800.0, window_h = 600.0;
    int precision = 6;
    try {
        if (args["seg_unit"]) {
            settings.seg_unit = args["seg_unit"].as<double>();
            if (!(settings.seg_unit > 0)) {
                cerr << "Error: seg-unit must be positive" << endl;
                return EXIT_FAILURE;
            }
        }

        if (args["batch_size"]) {
            settings.batch_size = args["batch_size"].as<int>();
        }

        if (args["margin"]) {
            settings.margin = args["margin"].as<double>();
        }

        if (args["precision"]) {
            precision = args["precision"].as<int>();
        }

        if (args["pen_width"]) {
            settings.default_pen_width = args["pen_width"].as<double>();
        }

    } catch (const std::exception& e) {
        cerr << "Error: Invalid argument value: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (args["window"]) {
        string val = args["window"].as<string>();
        if (!parse_window_size(val, window_w, window_h)) {
            cerr << "Error: Invalid window size \"" << val << "\", expected WIDTHxHEIGHT" << endl;
            return EXIT_FAILURE;
        }
    }

    settings.fit_to_geometry = args["fit_geometry"];
    settings.inherit_group_transforms = !args["no_group_transforms"];

    string in_f_name = "input.svg";
    istream *in_f = &cin;
    ifstream in_f_file;
    string out_f_name;
    ostream *out_f = &cout;
    ofstream out_f_file;

    if (args.pos.size() >= 1) {
        in_f_name = args.pos[0];

        if (args.pos.size() >= 2) {
            out_f_name = args.pos[1];
        }
    }

    if (in_f_name != "-") {
        in_f_file.open(in_f_name);
        if (!in_f_file) {
            cerr << "Error: Cannot open input file \"" << in_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        in_f = &in_f_file;
    }

    if (!out_f_name.empty() && out_f_name != "-") {
        out_f_file.open(out_f_name);
        if (!out_f_file) {
            cerr << "Error: Cannot open output file \"" << out_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        out_f = &out_f_file;
    }

    SVGDocument doc;
    if (!doc.load(*in_f, settings)) {
        cerr << "Error: Cannot load input file \"" << in_f_name << "\", exiting." << endl;
        return EXIT_FAILURE;
    }

    bool only_body = args["no_header"];

    string fmt = args["ofmt"] ? args["ofmt"].as<string>() : "svg";
    transform(fmt.begin(), fmt.end(), fmt.begin(), [](unsigned char c){ return std::tolower(c); });

    unique_ptr<Renderer> renderer;
    if (fmt == "svg") {
        renderer = make_unique<SVGTraceOutput>(*out_f, window_w, window_h, precision, only_body);

    } else if (fmt == "log") {
        renderer = make_unique<CommandLogOutput>(*out_f, window_w, window_h, precision, only_body);

    } else {
        cerr << "Error: Unknown output format \"" << fmt << "\"" << endl;
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_FAILURE;
    }

    trace_document(doc, *renderer, settings);

    if (!*out_f) {
        cerr << "Error: Cannot write output" << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
