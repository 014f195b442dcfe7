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
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "svg_geom.h"
#include "svg_import_util.h"

#include <minunit.h>

using namespace svgtrace;
using namespace std;

char msg[1024];

static void assert_extent(const Extent &expected, const Extent &actual) {
    if (!(expected == actual)) {
        snprintf(msg, sizeof(msg), "Expected %s, got %s", expected.dbg_str().c_str(), actual.dbg_str().c_str());
        mu_fail(msg);
    }
}

MU_TEST(test_page_size) {
    ExtentSource src;
    assert_extent(Extent(0, 0, 100, 50), resolve_extent("100", "50", "", {}, &src));
    mu_assert_int_eq(EXT_PAGE_SIZE, src);

    assert_extent(Extent(0, 0, 100, 50), resolve_extent(" 100px", "50mm ", "", {}, &src));
    mu_assert_int_eq(EXT_PAGE_SIZE, src);
}

MU_TEST(test_viewbox_wins) {
    ExtentSource src;
    assert_extent(Extent(0, 0, 200, 100), resolve_extent("100", "50", "0 0 200 100", {}, &src));
    mu_assert_int_eq(EXT_VIEWBOX, src);

    assert_extent(Extent(-10, 5, 10, 25), resolve_extent("", "", "-10,5,20,20", {}, &src));
    mu_assert_int_eq(EXT_VIEWBOX, src);
}

MU_TEST(test_invalid_viewbox_falls_through) {
    ExtentSource src;
    assert_extent(Extent(0, 0, 100, 50), resolve_extent("100", "50", "0 0 200", {}, &src));
    mu_assert_int_eq(EXT_PAGE_SIZE, src);

    assert_extent(Extent(0, 0, 100, 50), resolve_extent("100", "50", "0 0 -200 100", {}, &src));
    assert_extent(Extent(0, 0, 100, 50), resolve_extent("100", "50", "0 0 foo 100", {}, &src));
}

MU_TEST(test_polygon_bounds_extent) {
    vector<Polygon> polys {
        { { {-1, 0}, {2, 0}, {2, 2}, {-1, 0} } },
        { { {0, -1}, {5, 5}, {0, -1} } },
    };

    ExtentSource src;
    assert_extent(Extent(-1, -1, 5, 5), resolve_extent("", "", "", polys, &src));
    mu_assert_int_eq(EXT_POLYGON_BOUNDS, src);

    /* A zero or unparseable dimension makes the page size unusable */
    assert_extent(Extent(-1, -1, 5, 5), resolve_extent("0", "50", "", polys, &src));
    assert_extent(Extent(-1, -1, 5, 5), resolve_extent("100", "abc", "", polys, &src));
    assert_extent(Extent(-1, -1, 5, 5), resolve_extent("100%", "100%", "", polys, &src));
    mu_assert_int_eq(EXT_POLYGON_BOUNDS, src);
}

MU_TEST(test_default_extent) {
    ExtentSource src;
    assert_extent(Extent(0, 0, 1000, 1000), resolve_extent("", "", "", {}, &src));
    mu_assert_int_eq(EXT_DEFAULT, src);

    assert_extent(Extent(0, 0, 1000, 1000), resolve_extent("", "", "", { Polygon{}, Polygon{ Ring{} } }, &src));
    mu_assert_int_eq(EXT_DEFAULT, src);

    /* Non-finite geometry is no usable extent either */
    constexpr double inf = numeric_limits<double>::infinity();
    assert_extent(Extent(0, 0, 1000, 1000), resolve_extent("", "", "", { { { {0, 0}, {inf, 0}, {0, 0} } } }, &src));
    mu_assert_int_eq(EXT_DEFAULT, src);
}

MU_TEST(test_polygon_bounds) {
    assert_extent(Extent(0, 0, 1000, 1000), get_polygons_bounds({}));
    assert_extent(Extent(0, 0, 1000, 1000), get_polygons_bounds({ Polygon{}, Polygon{ Ring{} } }));

    vector<Polygon> polys {
        { { {1, 1}, {3, 1}, {3, 4}, {1, 1} } },
        { { {-2, 0}, {0, 0}, {-2, 0} }, { {0, 7}, {0, 7} } },
    };
    assert_extent(Extent(-2, 0, 3, 7), get_polygons_bounds(polys));
}

MU_TEST(test_view_mapping_wide) {
    ViewMapping vm = compute_view_mapping(Extent(0, 0, 200, 100), 800, 600);
    mu_assert_double_eq(1200.0, vm.window_w);
    mu_assert_double_eq(600.0, vm.window_h);

    mu_assert(fabs(vm.world.min_x - (-4.0)) < 1e-9, "min_x");
    mu_assert(fabs(vm.world.max_x - 204.0) < 1e-9, "max_x");
    mu_assert(fabs(vm.world.min_y - (-102.0)) < 1e-9, "min_y");
    mu_assert(fabs(vm.world.max_y - 2.0) < 1e-9, "max_y");
}

MU_TEST(test_view_mapping_tall) {
    ViewMapping vm = compute_view_mapping(Extent(0, 0, 50, 100), 800, 600, 0.0);
    mu_assert_double_eq(600.0, vm.window_w);
    mu_assert_double_eq(1200.0, vm.window_h);
    assert_extent(Extent(0, -100, 50, 0), vm.world);
}

MU_TEST(test_view_mapping_degenerate) {
    ViewMapping vm = compute_view_mapping(Extent(0, 0, 0, 0), 800, 600);
    mu_check(isfinite(vm.window_w) && isfinite(vm.window_h));
    mu_check(vm.window_w > 0 && vm.window_h > 0);
    mu_check(isfinite(vm.world.min_x) && isfinite(vm.world.min_y));
    mu_check(isfinite(vm.world.max_x) && isfinite(vm.world.max_y));

    vm = compute_view_mapping(Extent(0, 0, 10, 10), 0, 0);
    mu_check(isfinite(vm.window_w) && vm.window_w > 0);
}

MU_TEST(test_number_parsing) {
    vector<double> nums = parse_numbers("1,-2.5e2 .5-3 +4.e1x");
    mu_assert_int_eq(6, (int)nums.size());
    mu_assert_double_eq(1.0, nums[0]);
    mu_assert_double_eq(-250.0, nums[1]);
    mu_assert_double_eq(0.5, nums[2]);
    mu_assert_double_eq(-3.0, nums[3]);
    mu_assert_double_eq(4.0, nums[4]);
    mu_assert_double_eq(1.0, nums[5]);

    double d;
    mu_check(parse_full_number("42.5", d));
    mu_assert_double_eq(42.5, d);
    mu_check(!parse_full_number("42.5.1", d));
    mu_check(!parse_full_number("", d));

    mu_assert_double_eq(12.0, parse_length(" 12pt "));
    mu_assert_double_eq(7.0, parse_length("bogus", 7.0));
}

MU_TEST_SUITE(svg_geom_suite) {
    MU_RUN_TEST(test_page_size);
    MU_RUN_TEST(test_viewbox_wins);
    MU_RUN_TEST(test_invalid_viewbox_falls_through);
    MU_RUN_TEST(test_polygon_bounds_extent);
    MU_RUN_TEST(test_default_extent);
    MU_RUN_TEST(test_polygon_bounds);
    MU_RUN_TEST(test_view_mapping_wide);
    MU_RUN_TEST(test_view_mapping_tall);
    MU_RUN_TEST(test_view_mapping_degenerate);
    MU_RUN_TEST(test_number_parsing);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(svg_geom_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
