//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "acceptation_criteria.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

DominationObjectiveAcceptanceCriterion::DominationObjectiveAcceptanceCriterion(std::vector<size_t> indices) :
    indices(std::move(indices))
{
}

void DominationObjectiveAcceptanceCriterion::afterRegisterData()
{
    Population &pop = *population;
    t_assert(pop.isRegistered<Objective>(),
             "Domination-based Objective Acceptance Criterion requires the objective value to be defined.");
    cache.emplace(Cache{pop.getDataContainer<Objective>()});
}

short DominationObjectiveAcceptanceCriterion::compare(Individual &a, Individual &b)
{
    t_assert(cache.has_value(), "afterRegisterData should be called prior to comparing solutions.");
    auto &oa = cache->tgo.getData(a);
    auto &ob = cache->tgo.getData(b);

    short result = 3;
    for (size_t index : indices)
    {
        bool is_a_def = oa.objectives.size() > index;
        bool is_b_def = ob.objectives.size() > index;
        if (!is_a_def && !is_b_def)
            return 0;
        if (!is_a_def)
            return 2;
        if (!is_b_def)
            return 1;

        // a is strictly worse somewhere: a can no longer be better.
        if (oa.objectives[index] > ob.objectives[index])
            result &= 2;
        if (ob.objectives[index] > oa.objectives[index])
            result &= 1;
    }
    return result;
}

std::vector<std::vector<size_t>> non_dominated_sort(IPerformanceCriterion &criterion, std::vector<Individual> &pool)
{
    size_t n = pool.size();
    std::vector<size_t> domination_count(n, 0);
    std::vector<std::vector<size_t>> dominates(n);

    for (size_t a = 0; a < n; ++a)
    {
        for (size_t b = a + 1; b < n; ++b)
        {
            short c = criterion.compare(pool[a], pool[b]);
            if (c == 1)
            {
                dominates[a].push_back(b);
                domination_count[b]++;
            }
            else if (c == 2)
            {
                dominates[b].push_back(a);
                domination_count[a]++;
            }
        }
    }

    std::vector<std::vector<size_t>> fronts;
    std::vector<size_t> current;
    for (size_t a = 0; a < n; ++a)
        if (domination_count[a] == 0)
            current.push_back(a);

    while (!current.empty())
    {
        std::vector<size_t> next;
        for (size_t a : current)
        {
            for (size_t b : dominates[a])
            {
                if (--domination_count[b] == 0)
                    next.push_back(b);
            }
        }
        std::sort(next.begin(), next.end());
        fronts.push_back(std::move(current));
        current = std::move(next);
    }
    return fronts;
}

std::tuple<std::vector<double>, std::vector<double>, std::vector<double>> compute_objective_min_max_ranges(
    Population &population, const std::vector<size_t> &objective_indices, const std::vector<Individual> &pool)
{
    std::vector<double> ranges(objective_indices.size(), 0.0);
    std::vector<double> min_v(objective_indices.size(), std::numeric_limits<double>::infinity());
    std::vector<double> max_v(objective_indices.size(), -std::numeric_limits<double>::infinity());

    for (auto &i : pool)
    {
        auto &obj = population.getData<Objective>(i);
        for (size_t oi = 0; oi < objective_indices.size(); ++oi)
        {
            size_t o = objective_indices[oi];
            if (o >= obj.objectives.size() || std::isnan(obj.objectives[o]))
                continue;
            min_v[oi] = std::min(min_v[oi], obj.objectives[o]);
            max_v[oi] = std::max(max_v[oi], obj.objectives[o]);
            ranges[oi] = max_v[oi] - min_v[oi];
        }
    }

    return std::make_tuple(min_v, max_v, ranges);
}
