#include <sstream>
#include <stdexcept>
#include "solveresult.hpp"

using std::string;
using std::stringstream;

namespace Solver {
    SolveResult::SolveResult() : best_index(-1), best_guess(), best_score(0), perf_calls(0), perf_microseconds(0) {};

    std::ostream& operator<<(std::ostream& os, const SolveResult& s) {
        os << s.best_index << "," << (s.found() ? s.best_guess : "-") << "," << s.best_score << "," << s.perf_calls << "," << s.perf_microseconds;
        return os;
    }

    std::string SolveResult::to_string() const {
        stringstream ss;
        ss << *this;
        return ss.str();
    }

    void SolveResult::test() {
        SolveResult s;
        std::stringstream output1;
        std::stringstream expected;

        output1 << s << " " << s.found() << std::endl;

        s.best_index = 3;
        s.best_guess = "CRANE";
        s.best_score = 1.125;
        s.perf_calls = 234234;
        s.perf_microseconds = 111222333.456;
        output1 << s.to_string() << " " << s.found() << std::endl;

        expected
            << "-1,-,0,0,0 0" << std::endl
            << "3,CRANE,1.125,234234,1.11222e+08 1" << std::endl;

        std::string output1_str = output1.str();
        std::string expected_str = expected.str();
        if (output1_str != expected_str) {
            throw std::runtime_error("SolveResult::test() 1 failed, got " + output1_str + ", but expected " + expected_str);
        }
    }
}
