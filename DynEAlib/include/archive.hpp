//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains an interface & corresponding implementations for multi-objective archives.

#include <optional>

#include "base.hpp"

struct Archived
{
    bool added;
    bool dominated;
};

/**
 * @brief A collection of mutually non-dominated solutions.
 *
 * Archived solutions are copies: they are owned by the archive, and remain valid when the
 * solution they were copied from is dropped or modified.
 */
class IArchive : public IDataUser
{
  public:
    virtual Archived try_add(Individual candidate) = 0;

    virtual std::vector<Individual> &get_archived() = 0;

    // Drop all archived solutions, e.g. when their objective values have become stale.
    virtual void clear() = 0;
};

class BruteforceArchive : public IArchive
{
  public:
    BruteforceArchive(std::vector<size_t> objective_indices);

    void afterRegisterData() override;

    Archived try_add(Individual candidate) override;

    std::vector<Individual> &get_archived() override;

    void clear() override;

  private:
    struct Cache
    {
        TypedGetter<Objective> og;
    };
    std::optional<Cache> cache;

    std::vector<Individual> archive;
    const std::vector<size_t> objective_indices;
};
