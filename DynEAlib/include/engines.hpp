//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains a basic evolutionary engine for use with DynamicAlgorithm.

#include <optional>

#include "acceptation_criteria.hpp"
#include "base.hpp"
#include "dynamic_algorithm.hpp"

class IMutation : public IDataUser
{
  public:
    virtual void mutate(std::vector<Individual> &iis) = 0;
};

/**
 * @brief Swaps two distinct positions of a permutation.
 */
class SwapMutation : public IMutation
{
  public:
    void afterRegisterData() override;

    void mutate(std::vector<Individual> &iis) override;
};

/**
 * @brief Perturbs each variable with probability 1/l by a normally distributed offset.
 *
 * The standard deviation is relative to the range of the variable, results are clipped to the bounds.
 */
class GaussianMutation : public IMutation
{
    double relative_sigma;

  public:
    GaussianMutation(double relative_sigma = 0.1);

    void afterRegisterData() override;

    void mutate(std::vector<Individual> &iis) override;
};

/**
 * @brief A (mu + mu) multi-objective engine.
 *
 * Every generation each solution produces one mutated offspring. Survivors are selected by
 * non-dominated sorting. The front that does not fit entirely is truncated by crowding distance,
 * or, once a reference point has been set, by distance to the reference point.
 */
class ParetoMutationEngine : public IEvolutionaryEngine
{
    std::shared_ptr<ObjectiveFunction> problem;
    std::shared_ptr<IMutation> mutation;
    std::shared_ptr<DominationObjectiveAcceptanceCriterion> criterion;
    std::vector<size_t> objective_indices;

    std::optional<std::vector<double>> reference_point;

    std::vector<size_t> truncate(std::vector<Individual> &pool, const std::vector<size_t> &front, size_t k);

  public:
    ParetoMutationEngine(std::shared_ptr<ObjectiveFunction> problem,
                         std::shared_ptr<IMutation> mutation,
                         std::vector<size_t> objective_indices);

    void setPopulation(std::shared_ptr<Population> population) override;
    void registerData() override;
    void afterRegisterData() override;

    void advance(std::vector<Individual> &individuals) override;
    void evaluate(std::vector<Individual> &individuals) override;
    void setReferencePoint(const std::vector<double> &reference_point) override;

    std::string getName() override;
};
