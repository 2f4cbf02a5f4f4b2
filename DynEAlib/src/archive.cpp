//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "archive.hpp"
#include <iostream>

BruteforceArchive::BruteforceArchive(std::vector<size_t> objective_indices) :
    objective_indices(std::move(objective_indices))
{
}

void BruteforceArchive::afterRegisterData()
{
    Population &population = *this->population;
    t_assert(population.isRegistered<Objective>(), "An archive requires the objective value to be defined.");
    cache.emplace(Cache{population.getDataContainer<Objective>()});
}

Archived BruteforceArchive::try_add(Individual candidate)
{
    t_assert(cache.has_value(), "afterRegisterData should be called prior to archiving solutions.");
    Population &population = *this->population;

    Objective &candidate_o = cache->og.getData(candidate);
    for (size_t oi : objective_indices)
    {
        if (candidate_o.objectives.size() <= oi)
        {
            std::cerr << "Got solution with " << candidate_o.objectives.size()
                      << " objectives specified. Expected at least " << oi + 1 << "." << std::endl;
        }
        t_assert(candidate_o.objectives.size() > oi, "Solution to be added to archive should be evaluated.");
    }

    size_t archive_idx = 0;
    while (archive_idx < archive.size())
    {
        Objective &archived_o = cache->og.getData(archive[archive_idx]);
        bool archived_better_somewhere = false;
        bool candidate_better_somewhere = false;
        for (size_t o : objective_indices)
        {
            if (archived_o.objectives[o] < candidate_o.objectives[o])
                archived_better_somewhere = true;
            if (archived_o.objectives[o] > candidate_o.objectives[o])
                candidate_better_somewhere = true;
        }

        // Equal to an archived solution: nothing new.
        if (!archived_better_somewhere && !candidate_better_somewhere)
            return Archived{false, false};
        // Dominated by an archived solution.
        if (archived_better_somewhere && !candidate_better_somewhere)
            return Archived{false, true};

        if (candidate_better_somewhere && !archived_better_somewhere)
        {
            // Candidate dominates the archived solution: evict it, and re-examine this position.
            population.dropIndividual(archive[archive_idx]);
            archive.erase(archive.begin() + static_cast<std::ptrdiff_t>(archive_idx));
            continue;
        }
        ++archive_idx;
    }

    Individual archived_candidate = population.newIndividual();
    population.copyIndividual(candidate, archived_candidate);
    archive.push_back(archived_candidate);
    return Archived{true, false};
}

std::vector<Individual> &BruteforceArchive::get_archived()
{
    return archive;
}

void BruteforceArchive::clear()
{
    for (auto &ii : archive)
        population->dropIndividual(ii);
    archive.clear();
}
