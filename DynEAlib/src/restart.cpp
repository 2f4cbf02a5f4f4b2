//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "restart.hpp"
#include "acceptation_criteria.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <sstream>

static void drop_at(Population &pop, std::vector<Individual> &individuals, size_t position)
{
    pop.dropIndividual(individuals[position]);
    individuals.erase(individuals.begin() + static_cast<std::ptrdiff_t>(position));
}

// All solutions should be evaluated, and on the same number of objectives.
static size_t get_number_of_objectives(Population &pop, std::vector<Individual> &individuals)
{
    size_t m = pop.getData<Objective>(individuals[0]).objectives.size();
    t_assert(m > 0, "Solutions should be evaluated prior to removal.");
    for (auto &ii : individuals)
    {
        t_assert(pop.getData<Objective>(ii).objectives.size() == m,
                 "Solutions should be evaluated on the same number of objectives.");
    }
    return m;
}

static std::vector<std::vector<double>> normalized_points(Population &pop,
                                                          std::vector<Individual> &individuals,
                                                          const std::vector<size_t> &positions,
                                                          const std::vector<double> &min_v,
                                                          const std::vector<double> &ranges)
{
    std::vector<std::vector<double>> points;
    points.reserve(positions.size());
    for (size_t p : positions)
    {
        auto &objectives = pop.getData<Objective>(individuals[p]).objectives;
        std::vector<double> point(min_v.size(), 0.0);
        for (size_t o = 0; o < min_v.size(); ++o)
        {
            if (ranges[o] > 0.0)
                point[o] = (objectives[o] - min_v[o]) / ranges[o];
        }
        points.push_back(std::move(point));
    }
    return points;
}

// Position (within the front) of the smallest score, the first one on a tie.
static size_t position_of_least(const std::vector<double> &scores)
{
    size_t least = 0;
    for (size_t idx = 1; idx < scores.size(); ++idx)
    {
        // Scores are the result of a subtraction: allow for rounding.
        double tolerance = 1e-12 * std::max(1.0, std::abs(scores[least]));
        if (scores[idx] < scores[least] - tolerance)
            least = idx;
    }
    return least;
}

double hypervolume(std::vector<std::vector<double>> points, const std::vector<double> &reference)
{
    size_t d = reference.size();
    points.erase(std::remove_if(points.begin(),
                                points.end(),
                                [&reference, d](const std::vector<double> &p) {
                                    for (size_t o = 0; o < d; ++o)
                                        if (p[o] >= reference[o])
                                            return true;
                                    return false;
                                }),
                 points.end());
    if (points.empty() || d == 0)
        return 0.0;

    if (d == 1)
    {
        double best = reference[0];
        for (auto &p : points)
            best = std::min(best, p[0]);
        return reference[0] - best;
    }

    if (d == 2)
    {
        std::sort(points.begin(), points.end());
        double volume = 0.0;
        double lowest = reference[1];
        for (auto &p : points)
        {
            if (p[1] >= lowest)
                continue;
            volume += (reference[0] - p[0]) * (lowest - p[1]);
            lowest = p[1];
        }
        return volume;
    }

    // Slice along the last dimension: each slab is the hypervolume of the points below it.
    std::sort(points.begin(), points.end(), [d](const std::vector<double> &a, const std::vector<double> &b) {
        return a[d - 1] < b[d - 1];
    });
    std::vector<double> sub_reference(reference.begin(), reference.end() - 1);
    std::vector<std::vector<double>> projected;
    double volume = 0.0;
    for (size_t idx = 0; idx < points.size(); ++idx)
    {
        projected.emplace_back(points[idx].begin(), points[idx].end() - 1);
        double upper = idx + 1 < points.size() ? points[idx + 1][d - 1] : reference[d - 1];
        double height = upper - points[idx][d - 1];
        if (height > 0.0)
            volume += hypervolume(projected, sub_reference) * height;
    }
    return volume;
}

std::vector<double> crowding_distances(const std::vector<std::vector<double>> &points)
{
    size_t n = points.size();
    std::vector<double> distances(n, 0.0);
    if (n == 0)
        return distances;
    size_t m = points[0].size();

    std::vector<size_t> order(n);
    for (size_t o = 0; o < m; ++o)
    {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&points, o](size_t a, size_t b) {
            return points[a][o] < points[b][o];
        });
        distances[order.front()] = std::numeric_limits<double>::infinity();
        distances[order.back()] = std::numeric_limits<double>::infinity();
        double range = points[order.back()][o] - points[order.front()][o];
        if (range <= 0.0)
            continue;
        for (size_t idx = 1; idx + 1 < n; ++idx)
        {
            distances[order[idx]] += (points[order[idx + 1]][o] - points[order[idx - 1]][o]) / range;
        }
    }
    return distances;
}

// RestartStrategy
RestartStrategy::RestartStrategy(std::shared_ptr<IRemoveSolutions> remover, std::shared_ptr<ICreateSolutions> creator) :
    remover(std::move(remover)), creator(std::move(creator))
{
}
void RestartStrategy::setPopulation(std::shared_ptr<Population> population)
{
    IDataUser::setPopulation(population);
    remover->setPopulation(population);
    creator->setPopulation(population);
}
void RestartStrategy::registerData()
{
    remover->registerData();
    creator->registerData();
}
void RestartStrategy::afterRegisterData()
{
    remover->afterRegisterData();
    creator->afterRegisterData();
}

void RestartStrategy::restart(std::vector<Individual> &individuals)
{
    if (individuals.empty())
        throw restart_policy_error("cannot restart an empty population");

    size_t size_before = individuals.size();
    size_t removed = remover->remove(individuals, remover->get_n());
    creator->create(individuals, removed);

    if (individuals.size() != size_before)
    {
        std::stringstream ss;
        ss << "population size changed from " << size_before << " to " << individuals.size()
           << " (removed " << removed << ")";
        throw restart_policy_error(ss.str());
    }
}

// RemoveFirstNSolutions
RemoveFirstNSolutions::RemoveFirstNSolutions(size_t n) : IRemoveSolutions(n)
{
}
size_t RemoveFirstNSolutions::remove(std::vector<Individual> &individuals, size_t k)
{
    Population &pop = *population;
    k = std::min(k, individuals.size());
    for (size_t idx = 0; idx < k; ++idx)
        pop.dropIndividual(individuals[idx]);
    individuals.erase(individuals.begin(), individuals.begin() + static_cast<std::ptrdiff_t>(k));
    return k;
}

// RemoveNRandomSolutions
RemoveNRandomSolutions::RemoveNRandomSolutions(size_t n) : IRemoveSolutions(n)
{
}
void RemoveNRandomSolutions::afterRegisterData()
{
    t_assert(population->isGlobalRegistered<Rng>(), "Random removal requires a random number generator.");
}
size_t RemoveNRandomSolutions::remove(std::vector<Individual> &individuals, size_t k)
{
    Population &pop = *population;
    Rng &rng = *pop.getGlobalData<Rng>();
    k = std::min(k, individuals.size());
    for (size_t r = 0; r < k; ++r)
    {
        std::uniform_int_distribution<size_t> position(0, individuals.size() - 1);
        drop_at(pop, individuals, position(rng.rng));
    }
    return k;
}

// RemoveNSolutionsAccordingToTheHypervolumeContribution
RemoveNSolutionsAccordingToTheHypervolumeContribution::RemoveNSolutionsAccordingToTheHypervolumeContribution(
    size_t n, double offset) :
    IRemoveSolutions(n), offset(offset)
{
}
void RemoveNSolutionsAccordingToTheHypervolumeContribution::afterRegisterData()
{
    t_assert(population->isRegistered<Objective>(),
             "Hypervolume based removal requires the objective value to be defined.");
}
size_t RemoveNSolutionsAccordingToTheHypervolumeContribution::remove(std::vector<Individual> &individuals, size_t k)
{
    Population &pop = *population;
    k = std::min(k, individuals.size());
    if (k == 0)
        return 0;

    std::vector<size_t> objective_indices(get_number_of_objectives(pop, individuals));
    std::iota(objective_indices.begin(), objective_indices.end(), 0);
    DominationObjectiveAcceptanceCriterion domination(objective_indices);
    domination.setPopulation(population);
    domination.afterRegisterData();

    std::vector<double> min_v, max_v, ranges;
    std::tie(min_v, max_v, ranges) = compute_objective_min_max_ranges(pop, objective_indices, individuals);
    std::vector<double> reference(objective_indices.size(), 1.0 + offset);

    for (size_t r = 0; r < k; ++r)
    {
        auto fronts = non_dominated_sort(domination, individuals);
        auto &worst = fronts.back();
        auto points = normalized_points(pop, individuals, worst, min_v, ranges);

        double total = hypervolume(points, reference);
        std::vector<double> contributions(points.size());
        for (size_t w = 0; w < points.size(); ++w)
        {
            auto without = points;
            without.erase(without.begin() + static_cast<std::ptrdiff_t>(w));
            contributions[w] = total - hypervolume(std::move(without), reference);
        }
        drop_at(pop, individuals, worst[position_of_least(contributions)]);
    }
    return k;
}

// RemoveNSolutionsAccordingToTheCrowdingDistance
RemoveNSolutionsAccordingToTheCrowdingDistance::RemoveNSolutionsAccordingToTheCrowdingDistance(size_t n) :
    IRemoveSolutions(n)
{
}
void RemoveNSolutionsAccordingToTheCrowdingDistance::afterRegisterData()
{
    t_assert(population->isRegistered<Objective>(),
             "Crowding distance based removal requires the objective value to be defined.");
}
size_t RemoveNSolutionsAccordingToTheCrowdingDistance::remove(std::vector<Individual> &individuals, size_t k)
{
    Population &pop = *population;
    k = std::min(k, individuals.size());
    if (k == 0)
        return 0;

    std::vector<size_t> objective_indices(get_number_of_objectives(pop, individuals));
    std::iota(objective_indices.begin(), objective_indices.end(), 0);
    DominationObjectiveAcceptanceCriterion domination(objective_indices);
    domination.setPopulation(population);
    domination.afterRegisterData();

    std::vector<double> min_v, max_v, ranges;
    std::tie(min_v, max_v, ranges) = compute_objective_min_max_ranges(pop, objective_indices, individuals);

    for (size_t r = 0; r < k; ++r)
    {
        auto fronts = non_dominated_sort(domination, individuals);
        auto &worst = fronts.back();
        auto distances = crowding_distances(normalized_points(pop, individuals, worst, min_v, ranges));
        size_t least = 0;
        for (size_t idx = 1; idx < distances.size(); ++idx)
        {
            if (distances[idx] < distances[least])
                least = idx;
        }
        drop_at(pop, individuals, worst[least]);
    }
    return k;
}

// CreateNRandomSolutions
CreateNRandomSolutions::CreateNRandomSolutions(std::shared_ptr<ISolutionInitializer> initializer) :
    initializer(std::move(initializer))
{
}
void CreateNRandomSolutions::setPopulation(std::shared_ptr<Population> population)
{
    IDataUser::setPopulation(population);
    initializer->setPopulation(population);
}
void CreateNRandomSolutions::registerData()
{
    initializer->registerData();
}
void CreateNRandomSolutions::afterRegisterData()
{
    initializer->afterRegisterData();
}
void CreateNRandomSolutions::create(std::vector<Individual> &individuals, size_t k)
{
    Population &pop = *population;
    std::vector<Individual> created(k);
    for (auto &ii : created)
        ii = pop.newIndividual();
    initializer->initialize(created);
    individuals.insert(individuals.end(), created.begin(), created.end());
}

// CreateNSolutionsFromArchive
CreateNSolutionsFromArchive::CreateNSolutionsFromArchive(std::shared_ptr<IArchive> archive) :
    archive(std::move(archive))
{
}
void CreateNSolutionsFromArchive::setPopulation(std::shared_ptr<Population> population)
{
    IDataUser::setPopulation(population);
    archive->setPopulation(population);
}
void CreateNSolutionsFromArchive::registerData()
{
    archive->registerData();
}
void CreateNSolutionsFromArchive::afterRegisterData()
{
    archive->afterRegisterData();
}
void CreateNSolutionsFromArchive::create(std::vector<Individual> &individuals, size_t k)
{
    if (k == 0)
        return;
    Population &pop = *population;
    auto &archived = archive->get_archived();
    if (archived.empty())
        throw restart_policy_error("cannot create solutions from an empty archive");

    for (size_t idx = 0; idx < k; ++idx)
    {
        Individual ii = pop.newIndividual();
        pop.copyIndividual(archived[idx % archived.size()], ii);
        individuals.push_back(ii);
    }
}
