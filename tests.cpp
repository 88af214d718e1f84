#include <iostream>
#include <stdexcept>
#include "selftest.hpp"

int main() {
    try {
        run_self_tests();
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
