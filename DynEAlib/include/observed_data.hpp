//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <map>
#include <memory>
#include <string>

#include "base.hpp"

/**
 * @brief Snapshot of the state of a run, as emitted by a DynamicAlgorithm.
 *
 * Immutable after construction. The solutions are a deep copy of the population at the
 * moment of emission: later changes to the population are not reflected here. Copies of
 * a snapshot share the same (read-only) solution data.
 */
class AlgorithmObservedData
{
    std::shared_ptr<const SubpopulationData> solutions;
    size_t completed_iterations;
    std::string algorithm_name;
    std::string problem_name;
    size_t number_of_objectives;
    std::map<std::string, std::string> metadata;

  public:
    AlgorithmObservedData(std::shared_ptr<const SubpopulationData> solutions,
                          size_t completed_iterations,
                          std::string algorithm_name,
                          std::string problem_name,
                          size_t number_of_objectives,
                          std::map<std::string, std::string> metadata = {}) :
        solutions(std::move(solutions)),
        completed_iterations(completed_iterations),
        algorithm_name(std::move(algorithm_name)),
        problem_name(std::move(problem_name)),
        number_of_objectives(number_of_objectives),
        metadata(std::move(metadata))
    {
    }

    const SubpopulationData &get_solutions() const
    {
        return *solutions;
    }
    // Objective values of the solutions, in population order.
    const std::vector<Objective> &get_objectives() const
    {
        return solutions->get<Objective>();
    }

    size_t get_completed_iterations() const
    {
        return completed_iterations;
    }
    const std::string &get_algorithm_name() const
    {
        return algorithm_name;
    }
    const std::string &get_problem_name() const
    {
        return problem_name;
    }
    size_t get_number_of_objectives() const
    {
        return number_of_objectives;
    }
    const std::map<std::string, std::string> &get_metadata() const
    {
        return metadata;
    }
};
