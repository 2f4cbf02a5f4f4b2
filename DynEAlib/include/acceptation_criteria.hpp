//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains the comparisons between solutions used to rank a population.

#include <tuple>

#include "base.hpp"

/**
 * @brief Performance criterion that performs a domination check
 *
 * Comparison generally behaves as follows (lower is better):
 * - a is better than b if for all indices provided a <= b, and for at least one a < b.
 * - comparison behaves equivalently for b better than a.
 * - If all equal, equality is returned.
 * - If none of the aforementioned traits hold, non-determinable is returned.
 *
 * An unevaluated solution (fewer objectives than required) is worse than any evaluated one.
 */
class DominationObjectiveAcceptanceCriterion : public IPerformanceCriterion
{
    const std::vector<size_t> indices;

    struct Cache
    {
        TypedGetter<Objective> tgo;
    };
    std::optional<Cache> cache;

  public:
    DominationObjectiveAcceptanceCriterion(std::vector<size_t> indices);

    void afterRegisterData() override;

    short compare(Individual &a, Individual &b) override;

    const std::vector<size_t> &getIndices()
    {
        return indices;
    }
};

/**
 * @brief Sort a pool of solutions into non-dominated fronts.
 *
 * @param criterion the criterion deciding domination (1: a better, 2: b better).
 * @param pool the solutions to sort.
 * @return fronts of positions into pool, best front first. Positions within a front are ascending.
 */
std::vector<std::vector<size_t>> non_dominated_sort(IPerformanceCriterion &criterion, std::vector<Individual> &pool);

/**
 * @brief Compute objective minimum, maximum, and range over a pool of solutions for specific objective indices.
 *
 * @param population Population object to access solution data.
 * @param objective_indices Objective indices to compute min, max, range for.
 * @param pool The pool of individuals to compute min, max, range over.
 * @return std::tuple<std::vector<double>, std::vector<double>, std::vector<double>> Tuple of vectors for min, max,
 * ranges (in that order).
 */
std::tuple<std::vector<double>, std::vector<double>, std::vector<double>> compute_objective_min_max_ranges(
    Population &population, const std::vector<size_t> &objective_indices, const std::vector<Individual> &pool);
