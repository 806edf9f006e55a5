#include "rfnav/coverage_box.hpp"
#include "rfnav/geo.hpp"
#include "test_common.hpp"

#include <cstdlib>

using namespace rfnav;

static void test_empty_box() {
    test::section("empty box expands on first update");
    CoverageBox box;
    test::check(box.empty(), __LINE__);
    test::check(box.update(48.1, 11.5), __LINE__);
    test::check(!box.empty(), __LINE__);
    test::check_near(box.center_lat(), 48.1, 1e-12, __LINE__);
    test::check_near(box.center_lon(), 11.5, 1e-12, __LINE__);
    test::check_near(box.radius(), 0.0, 1e-9, __LINE__);
    test::check(!box.update(48.1, 11.5), __LINE__);
}

static void test_growth() {
    test::section("radii follow the extents");
    CoverageBox box(48.0, 11.0);
    test::check(box.update(48.001, 11.0), __LINE__);
    test::check_near(box.center_lat(), 48.0005, 1e-9, __LINE__);
    test::check_near(box.radius_ns(), 0.0005 * geo::DEG_TO_METER, 1e-6, __LINE__);
    test::check_near(box.radius_ew(), 0.0, 1e-9, __LINE__);
    test::check(box.update(48.0005, 11.002), __LINE__);
    test::check(box.radius_ew() > 0.0, __LINE__);
    test::check(box.radius() >= box.radius_ns(), __LINE__);
    test::check(box.contains(48.0005, 11.001), __LINE__);
    test::check(!box.contains(48.0, 11.0), __LINE__); // on the edge
    test::check(!box.update(48.0005, 11.001), __LINE__); // inside
}

static void test_monotonic_random() {
    test::section("extents are ordered and never shrink");
    std::srand(7);
    CoverageBox box;
    double n = -91, s = 91, e = -181, w = 181;
    for (int i = 0; i < 2000; ++i) {
        double lat = 47.0 + (std::rand() % 20000) / 10000.0;
        double lon = 10.0 + (std::rand() % 20000) / 10000.0;
        box.update(lat, lon);
        test::check(box.north() >= box.south(), __LINE__);
        test::check(box.east() >= box.west(), __LINE__);
        test::check(box.north() >= n && box.south() <= s && box.east() >= e && box.west() <= w, __LINE__);
        n = box.north(); s = box.south(); e = box.east(); w = box.west();
    }
}

static void test_saved_box() {
    test::section("box rebuilt from center and radii");
    CoverageBox box(52.0, 13.0, 100.0, 50.0);
    test::check_near(box.radius_ns(), 100.0, 1e-9, __LINE__);
    test::check_near(box.radius_ew(), 50.0, 1e-9, __LINE__);
    test::check(box.contains(52.0, 13.0), __LINE__);
    test::check_near((box.north() - box.south()) * geo::DEG_TO_METER, 200.0, 1e-6, __LINE__);

    CoverageBox invalid(52.0, 13.0, -1.0, -1.0);
    test::check(invalid.empty(), __LINE__);

    CoverageBox a(52.0, 13.0, 100.0, 50.0);
    test::check(a == box, __LINE__);
    test::check(!box.to_string().empty(), __LINE__);
}

static void test_near_pole() {
    test::section("longitude scaling stays finite near the pole");
    CoverageBox box(89.9999, 0.0, 10.0, 10.0);
    test::check(box.east() > box.west(), __LINE__);
    test::check(std::isfinite(box.east()), __LINE__);
}

int main() {
    std::cout << "CoverageBox test" << std::endl;
    test_empty_box();
    test_growth();
    test_monotonic_random();
    test_saved_box();
    test_near_pole();
    return test::finish("coverage_box_test");
}
