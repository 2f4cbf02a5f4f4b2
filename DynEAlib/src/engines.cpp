//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "engines.hpp"
#include "restart.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

// SwapMutation
void SwapMutation::afterRegisterData()
{
    Population &pop = *population;
    t_assert(pop.isRegistered<GenotypePermutation>(), "Swap mutation requires a permutation genotype.");
    t_assert(pop.isGlobalRegistered<Rng>(), "Swap mutation requires a random number generator.");
}
void SwapMutation::mutate(std::vector<Individual> &iis)
{
    Population &pop = *population;
    Rng &rng = *pop.getGlobalData<Rng>();
    for (auto ii : iis)
    {
        auto &genotype = pop.getData<GenotypePermutation>(ii).genotype;
        if (genotype.size() < 2)
            continue;
        std::uniform_int_distribution<size_t> position(0, genotype.size() - 1);
        size_t a = position(rng.rng);
        size_t b = position(rng.rng);
        while (b == a)
            b = position(rng.rng);
        std::swap(genotype[a], genotype[b]);
    }
}

// GaussianMutation
GaussianMutation::GaussianMutation(double relative_sigma) : relative_sigma(relative_sigma)
{
}
void GaussianMutation::afterRegisterData()
{
    Population &pop = *population;
    t_assert(pop.isRegistered<GenotypeContinuous>(), "Gaussian mutation requires a continuous genotype.");
    t_assert(pop.isGlobalRegistered<GenotypeContinuousData>(), "Gaussian mutation requires variable bounds.");
    t_assert(pop.isGlobalRegistered<Rng>(), "Gaussian mutation requires a random number generator.");
}
void GaussianMutation::mutate(std::vector<Individual> &iis)
{
    Population &pop = *population;
    Rng &rng = *pop.getGlobalData<Rng>();
    GenotypeContinuousData &data = *pop.getGlobalData<GenotypeContinuousData>();
    std::uniform_real_distribution<double> p(0.0, 1.0);
    std::normal_distribution<double> offset(0.0, 1.0);
    double probability = 1.0 / static_cast<double>(std::max<size_t>(data.l, 1));

    for (auto ii : iis)
    {
        auto &genotype = pop.getData<GenotypeContinuous>(ii).genotype;
        for (size_t v = 0; v < genotype.size(); ++v)
        {
            if (p(rng.rng) >= probability)
                continue;
            double range = data.upper[v] - data.lower[v];
            genotype[v] = std::clamp(genotype[v] + offset(rng.rng) * relative_sigma * range, data.lower[v], data.upper[v]);
        }
    }
}

// ParetoMutationEngine
ParetoMutationEngine::ParetoMutationEngine(std::shared_ptr<ObjectiveFunction> problem,
                                           std::shared_ptr<IMutation> mutation,
                                           std::vector<size_t> objective_indices) :
    problem(problem),
    mutation(mutation),
    criterion(std::make_shared<DominationObjectiveAcceptanceCriterion>(objective_indices)),
    objective_indices(objective_indices)
{
}

void ParetoMutationEngine::setPopulation(std::shared_ptr<Population> population)
{
    IEvolutionaryEngine::setPopulation(population);
    problem->setPopulation(population);
    mutation->setPopulation(population);
    criterion->setPopulation(population);
}
void ParetoMutationEngine::registerData()
{
    problem->registerData();
    mutation->registerData();
    criterion->registerData();
}
void ParetoMutationEngine::afterRegisterData()
{
    problem->afterRegisterData();
    mutation->afterRegisterData();
    criterion->afterRegisterData();
}

void ParetoMutationEngine::evaluate(std::vector<Individual> &individuals)
{
    for (auto ii : individuals)
        problem->evaluate(ii);
}

void ParetoMutationEngine::advance(std::vector<Individual> &individuals)
{
    Population &pop = *population;
    size_t target = individuals.size();

    std::vector<Individual> pool = individuals;
    std::vector<Individual> offspring(target);
    for (size_t i = 0; i < target; ++i)
    {
        offspring[i] = pop.newIndividual();
        pop.copyIndividual(individuals[i], offspring[i]);
    }
    mutation->mutate(offspring);
    evaluate(offspring);
    pool.insert(pool.end(), offspring.begin(), offspring.end());

    std::vector<char> survives(pool.size(), 0);
    size_t num_survivors = 0;
    for (auto &front : non_dominated_sort(*criterion, pool))
    {
        if (num_survivors + front.size() <= target)
        {
            for (size_t p : front)
                survives[p] = 1;
            num_survivors += front.size();
        }
        else
        {
            for (size_t p : truncate(pool, front, target - num_survivors))
                survives[p] = 1;
            num_survivors = target;
        }
        if (num_survivors == target)
            break;
    }

    individuals.clear();
    for (size_t p = 0; p < pool.size(); ++p)
    {
        if (survives[p])
            individuals.push_back(pool[p]);
        else
            pop.dropIndividual(pool[p]);
    }
}

std::vector<size_t> ParetoMutationEngine::truncate(std::vector<Individual> &pool,
                                                   const std::vector<size_t> &front,
                                                   size_t k)
{
    Population &pop = *population;
    std::vector<std::vector<double>> points;
    for (size_t p : front)
    {
        auto &objectives = pop.getData<Objective>(pool[p]).objectives;
        std::vector<double> point;
        for (size_t o : objective_indices)
            point.push_back(objectives[o]);
        points.push_back(std::move(point));
    }

    // Lower score is preferred.
    std::vector<double> score(front.size());
    if (reference_point.has_value())
    {
        auto &r = *reference_point;
        for (size_t f = 0; f < front.size(); ++f)
        {
            double d = 0.0;
            for (size_t o = 0; o < points[f].size() && o < r.size(); ++o)
                d += (points[f][o] - r[o]) * (points[f][o] - r[o]);
            score[f] = std::sqrt(d);
        }
    }
    else
    {
        auto distances = crowding_distances(points);
        for (size_t f = 0; f < front.size(); ++f)
            score[f] = -distances[f];
    }

    std::vector<size_t> order(front.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&score](size_t a, size_t b) { return score[a] < score[b]; });

    std::vector<size_t> selected;
    for (size_t idx = 0; idx < k && idx < order.size(); ++idx)
        selected.push_back(front[order[idx]]);
    return selected;
}

void ParetoMutationEngine::setReferencePoint(const std::vector<double> &reference_point)
{
    t_assert(reference_point.size() == objective_indices.size(),
             "Reference point should have a value for every objective.");
    this->reference_point = reference_point;
}

std::string ParetoMutationEngine::getName()
{
    return "ParetoMutationEngine";
}
