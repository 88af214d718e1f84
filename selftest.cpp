#include "selftest.hpp"
#include "alphabet.hpp"
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"
#include "solveresult.hpp"
#include "solver.hpp"
#include "reducer.hpp"
#include "opener.hpp"
#include "agent.hpp"
#include "game.hpp"

void run_self_tests() {
    Alphabet::test();
    Word::test();
    Result::test();
    Dictionary::test();
    Solver::SolveResult::test();
    Solver::test();
    Reducer::test();
    Opener::test();
    Agent::test();
    Game::test();
}
