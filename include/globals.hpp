#pragma once
#include "evaluator.hpp"

// Defines the native builtins (clock, type, rand, randint, round, help, dir)
// in env. Builtins that print write to the evaluator's output stream.
void init_globals(EnvPtr env, Evaluator* evaluator);
