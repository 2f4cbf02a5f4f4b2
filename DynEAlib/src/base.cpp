//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "base.hpp"

// SubpopulationData
SubpopulationData::SubpopulationData(size_t num, std::vector<std::shared_ptr<const ISubDataContainer>> containers) :
    num(num), containers(std::move(containers))
{
}

// Population
Individual Population::newIndividual()
{
    size_t idx;
    if (reuse.empty())
    {
        idx = in_use.size();
        in_use.push_back(1);
        for (auto &t : registration_order)
        {
            containers[t]->resize(in_use.size());
        }
    }
    else
    {
        idx = reuse.back();
        reuse.pop_back();
        in_use[idx] = 1;
    }
    num_active++;
    return Individual{idx, this};
}

void Population::dropIndividual(Individual ii)
{
    t_assert(ii.creator == this, "Individual should belong to this population.");
    t_assert(ii.i < in_use.size() && in_use[ii.i] == 1, "Individual should be alive to be dropped.");
    // Reset the data, such that a reused slot starts out clean.
    for (auto &t : registration_order)
    {
        containers[t]->reset(ii.i);
    }
    in_use[ii.i] = 0;
    reuse.push_back(ii.i);
    num_active--;
}

void Population::copyIndividual(Individual from, Individual to)
{
    t_assert(from.creator == this && to.creator == this, "Individuals should belong to this population.");
    for (auto &t : registration_order)
    {
        containers[t]->copy(from.i, to.i);
    }
}

size_t Population::capacity() const
{
    return in_use.size();
}

size_t Population::active() const
{
    return num_active;
}

SubpopulationData Population::getSubpopulationData(const std::vector<Individual> &iis) const
{
    std::vector<std::shared_ptr<const ISubDataContainer>> copied;
    copied.reserve(registration_order.size());
    for (auto &t : registration_order)
    {
        copied.push_back(containers.at(t)->extract(iis));
    }
    return SubpopulationData(iis.size(), std::move(copied));
}
