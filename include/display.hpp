#pragma once

#include "analysis.hpp"
#include "validation.hpp"
#include "logger.hpp"
#include "verifier.hpp"

namespace hfvrp
{
    void print_solution(std::ostream &stream, const Problem &problem, const Solution &solution);
    void print_validation(std::ostream &stream, const ValidationReport &report);
    void print_analysis(std::ostream &stream, const SolutionAnalysis &analysis);
    void print_verified(std::ostream &stream, const char *title, const VerifiedSolution &solution);
    void print_comparison(std::ostream &stream, const VerifiedSolution &search, const VerifiedSolution &verifier);
}
