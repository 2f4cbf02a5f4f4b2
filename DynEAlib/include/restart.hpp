//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains the policies that replace part of a population after a change.

#include <optional>
#include <string>

#include "archive.hpp"
#include "base.hpp"

class restart_policy_error : public std::exception
{
    std::string message;

  public:
    restart_policy_error(const std::string &message) : message(message)
    {
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

/**
 * @brief Removes solutions from a population.
 *
 * Removed individuals are taken out of the vector and dropped from the Population.
 */
class IRemoveSolutions : public IDataUser
{
  protected:
    size_t n;

  public:
    IRemoveSolutions(size_t n) : n(n)
    {
    }

    // The number of solutions this policy is configured to remove upon a restart.
    size_t get_n()
    {
        return n;
    }

    /**
     * @brief Remove min(k, |individuals|) solutions.
     *
     * @return size_t the number of solutions actually removed.
     */
    virtual size_t remove(std::vector<Individual> &individuals, size_t k) = 0;
};

/**
 * @brief Appends exactly k new (unevaluated) solutions to a population.
 */
class ICreateSolutions : public IDataUser
{
  public:
    virtual void create(std::vector<Individual> &individuals, size_t k) = 0;
};

/**
 * @brief Combination of a removal and a creation policy.
 *
 * A restart removes the configured number of solutions, and creates as many as were
 * removed, such that the size of the population is preserved.
 */
class RestartStrategy : public IDataUser
{
    std::shared_ptr<IRemoveSolutions> remover;
    std::shared_ptr<ICreateSolutions> creator;

  public:
    RestartStrategy(std::shared_ptr<IRemoveSolutions> remover, std::shared_ptr<ICreateSolutions> creator);

    void setPopulation(std::shared_ptr<Population> population) override;
    void registerData() override;
    void afterRegisterData() override;

    void restart(std::vector<Individual> &individuals);
};

class RemoveFirstNSolutions : public IRemoveSolutions
{
  public:
    RemoveFirstNSolutions(size_t n);

    size_t remove(std::vector<Individual> &individuals, size_t k) override;
};

class RemoveNRandomSolutions : public IRemoveSolutions
{
  public:
    RemoveNRandomSolutions(size_t n);

    void afterRegisterData() override;

    size_t remove(std::vector<Individual> &individuals, size_t k) override;
};

/**
 * @brief Removes the solutions contributing least to the hypervolume of the worst front.
 *
 * Objectives are normalized to the bounds of the population at the start of the removal,
 * the reference point is 1 + offset in every dimension. Removal is one at a time: the
 * contributions are recomputed after every removal. Ties are broken by the lowest position.
 */
class RemoveNSolutionsAccordingToTheHypervolumeContribution : public IRemoveSolutions
{
    double offset;

  public:
    RemoveNSolutionsAccordingToTheHypervolumeContribution(size_t n, double offset = 0.1);

    void afterRegisterData() override;

    size_t remove(std::vector<Individual> &individuals, size_t k) override;
};

/**
 * @brief Removes the most crowded solutions of the worst front.
 *
 * Crowding distances are recomputed after every removal. Ties are broken by the lowest position.
 */
class RemoveNSolutionsAccordingToTheCrowdingDistance : public IRemoveSolutions
{
  public:
    RemoveNSolutionsAccordingToTheCrowdingDistance(size_t n);

    void afterRegisterData() override;

    size_t remove(std::vector<Individual> &individuals, size_t k) override;
};

class CreateNRandomSolutions : public ICreateSolutions
{
    std::shared_ptr<ISolutionInitializer> initializer;

  public:
    CreateNRandomSolutions(std::shared_ptr<ISolutionInitializer> initializer);

    void setPopulation(std::shared_ptr<Population> population) override;
    void registerData() override;
    void afterRegisterData() override;

    void create(std::vector<Individual> &individuals, size_t k) override;
};

/**
 * @brief Creates solutions by copying archived solutions, cycling through the archive in order.
 */
class CreateNSolutionsFromArchive : public ICreateSolutions
{
    std::shared_ptr<IArchive> archive;

  public:
    CreateNSolutionsFromArchive(std::shared_ptr<IArchive> archive);

    void setPopulation(std::shared_ptr<Population> population) override;
    void registerData() override;
    void afterRegisterData() override;

    void create(std::vector<Individual> &individuals, size_t k) override;
};

// Hypervolume (lower is better) of a set of points with respect to a reference point.
// Points not strictly dominating the reference point contribute nothing.
double hypervolume(std::vector<std::vector<double>> points, const std::vector<double> &reference);

// Crowding distance of each point within the set. Boundary points get an infinite distance.
std::vector<double> crowding_distances(const std::vector<std::vector<double>> &points);
