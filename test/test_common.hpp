#pragma once

#include <cmath>
#include <iostream>
#include <string>

// Console checks for the self-checking test executables. Each test prints
// what it verifies and main() returns non-zero after any failure.
namespace rfnav::test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline void check(bool ok, int line) {
    if (ok) return;
    ++failures();
    std::cerr << "  FAILED at line " << line << "\n";
}

inline void check_near(double a, double b, double tol, int line) {
    if (std::fabs(a - b) <= tol) return;
    ++failures();
    std::cerr << "  FAILED at line " << line << ": " << a << " vs " << b << " (tol " << tol << ")\n";
}

inline void section(const std::string& name) {
    std::cout << "- " << name << std::endl;
}

inline int finish(const char* suite) {
    if (failures() == 0) {
        std::cout << suite << ": all checks passed" << std::endl;
        return 0;
    }
    std::cerr << suite << ": " << failures() << " check(s) failed" << std::endl;
    return 1;
}

} // namespace rfnav::test
