//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "problems.hpp"
#include <cmath>
#include <sstream>

// Dynamic Multi-objective TSP
double evaluate_tour(const std::vector<std::vector<double>> &matrix, const std::vector<size_t> &tour)
{
    if (tour.empty())
        return 0.0;
    double total = 0.0;
    for (size_t idx = 0; idx + 1 < tour.size(); ++idx)
    {
        total += matrix[tour[idx]][tour[idx + 1]];
    }
    // Close the tour.
    total += matrix[tour.back()][tour.front()];
    return total;
}

TSPInstance generate_euclidean_tsp_instance(size_t num_cities, Rng &rng)
{
    std::uniform_real_distribution<double> coordinate(0.0, 1000.0);
    std::uniform_real_distribution<double> cost_per_unit(0.5, 1.5);
    std::vector<double> xs(num_cities);
    std::vector<double> ys(num_cities);
    for (size_t i = 0; i < num_cities; ++i)
    {
        xs[i] = coordinate(rng.rng);
        ys[i] = coordinate(rng.rng);
    }

    TSPInstance instance{num_cities,
                         std::vector<std::vector<double>>(num_cities, std::vector<double>(num_cities, 0.0)),
                         std::vector<std::vector<double>>(num_cities, std::vector<double>(num_cities, 0.0))};
    for (size_t i = 0; i < num_cities; ++i)
    {
        for (size_t j = i + 1; j < num_cities; ++j)
        {
            double d = std::hypot(xs[i] - xs[j], ys[i] - ys[j]);
            double c = d * cost_per_unit(rng.rng);
            instance.distance[i][j] = d;
            instance.distance[j][i] = d;
            instance.cost[i][j] = c;
            instance.cost[j][i] = c;
        }
    }
    return instance;
}

DynamicMultiObjectiveTSP::DynamicMultiObjectiveTSP(TSPInstance instance) : instance(std::move(instance))
{
    auto &i = this->instance;
    bool valid = i.num_cities > 1 && i.distance.size() == i.num_cities && i.cost.size() == i.num_cities;
    for (size_t r = 0; valid && r < i.num_cities; ++r)
    {
        valid = i.distance[r].size() == i.num_cities && i.cost[r].size() == i.num_cities;
    }
    if (!valid)
        throw invalid_instance();
}

void DynamicMultiObjectiveTSP::validate(const TSPMatrixData &payload)
{
    std::stringstream ss;
    if (payload.matrix_id != TSPMatrix::DISTANCE && payload.matrix_id != TSPMatrix::COST)
    {
        ss << "matrix identifier " << static_cast<int>(payload.matrix_id) << " is neither distance nor cost";
        throw malformed_update(ss.str());
    }
    if (payload.x >= instance.num_cities || payload.y >= instance.num_cities)
    {
        ss << "edge (" << payload.x << ", " << payload.y << ") is out of range for an instance with "
           << instance.num_cities << " cities";
        throw malformed_update(ss.str());
    }
    if (payload.x == payload.y)
    {
        ss << "edge (" << payload.x << ", " << payload.y << ") is a self-loop";
        throw malformed_update(ss.str());
    }
    if (!std::isfinite(payload.value) || payload.value < 0.0)
    {
        ss << "value " << payload.value << " is not a finite non-negative number";
        throw malformed_update(ss.str());
    }
}

void DynamicMultiObjectiveTSP::update(const TSPMatrixData &payload)
{
    auto &matrix = payload.matrix_id == TSPMatrix::DISTANCE ? instance.distance : instance.cost;
    matrix[payload.x][payload.y] = payload.value;
    matrix[payload.y][payload.x] = payload.value;
}

void DynamicMultiObjectiveTSP::evaluate(Individual i)
{
    t_assert(cache.has_value(), "afterRegisterData should be called prior to evaluation.");
    GenotypePermutation &genotype = cache->ggp.getData(i);
    Objective &objective = cache->go.getData(i);
    t_assert(genotype.genotype.size() == instance.num_cities, "Tour should visit every city.");

    std::lock_guard<std::mutex> lock(mtx);
    objective.objectives.resize(2);
    objective.objectives[0] = evaluate_tour(instance.distance, genotype.genotype);
    objective.objectives[1] = evaluate_tour(instance.cost, genotype.genotype);
}

void DynamicMultiObjectiveTSP::registerData()
{
    Population &pop = *population;
    pop.registerData<GenotypePermutation>();
    pop.registerData<Objective>();
    pop.registerGlobalData(GenotypePermutationData{instance.num_cities});
}

void DynamicMultiObjectiveTSP::afterRegisterData()
{
    Population &pop = *population;
    cache.emplace(Cache{pop.getDataContainer<GenotypePermutation>(), pop.getDataContainer<Objective>()});
}

std::string DynamicMultiObjectiveTSP::get_name()
{
    return "DynamicMultiObjectiveTSP";
}
size_t DynamicMultiObjectiveTSP::get_number_of_objectives()
{
    return 2;
}
size_t DynamicMultiObjectiveTSP::get_number_of_variables()
{
    return instance.num_cities;
}

TSPInstance DynamicMultiObjectiveTSP::get_instance()
{
    std::lock_guard<std::mutex> lock(mtx);
    return instance;
}

// FDA2
FDA2::FDA2(size_t l, int n_t, int tau_t) : l(l), n_t(n_t), tau_t(tau_t)
{
    // Needs at least one variable in each of the three groups.
    if (l < 3 || n_t <= 0 || tau_t <= 0)
        throw invalid_instance();
}

void FDA2::validate(const int &payload)
{
    if (payload < 0)
    {
        throw malformed_update("time step counter should be non-negative, got " + std::to_string(payload));
    }
}

void FDA2::update(const int &payload)
{
    tau = payload;
    time = (1.0 / static_cast<double>(n_t)) * std::floor(static_cast<double>(tau) / static_cast<double>(tau_t));
}

void FDA2::evaluate(Individual i)
{
    t_assert(cache.has_value(), "afterRegisterData should be called prior to evaluation.");
    GenotypeContinuous &genotype = cache->ggc.getData(i);
    Objective &objective = cache->go.getData(i);
    auto &x = genotype.genotype;
    t_assert(x.size() == l, "Solution should have the number of variables of the problem.");

    std::lock_guard<std::mutex> lock(mtx);
    // x_1 is the position along the front, x_II controls the distance to the front,
    // x_III the (time dependent) shape of the front.
    size_t end_ii = l / 2 + 1;
    double g = 1.0;
    for (size_t v = 1; v < end_ii; ++v)
        g += x[v] * x[v];

    double h_t = 0.75 + 0.7 * std::sin(0.5 * std::acos(-1.0) * time);
    double exponent_denominator = h_t;
    for (size_t v = end_ii; v < l; ++v)
        exponent_denominator += (x[v] - h_t) * (x[v] - h_t);

    double f1 = x[0];
    double h = 1.0 - std::pow(f1 / g, 1.0 / exponent_denominator);

    objective.objectives.resize(2);
    objective.objectives[0] = f1;
    objective.objectives[1] = g * h;
}

void FDA2::registerData()
{
    Population &pop = *population;
    pop.registerData<GenotypeContinuous>();
    pop.registerData<Objective>();

    std::vector<double> lower(l, -1.0);
    std::vector<double> upper(l, 1.0);
    lower[0] = 0.0;
    pop.registerGlobalData(GenotypeContinuousData{l, lower, upper});
}

void FDA2::afterRegisterData()
{
    Population &pop = *population;
    cache.emplace(Cache{pop.getDataContainer<GenotypeContinuous>(), pop.getDataContainer<Objective>()});
}

std::string FDA2::get_name()
{
    return "FDA2";
}
size_t FDA2::get_number_of_objectives()
{
    return 2;
}
size_t FDA2::get_number_of_variables()
{
    return l;
}

double FDA2::get_time()
{
    std::lock_guard<std::mutex> lock(mtx);
    return time;
}
int FDA2::get_tau()
{
    std::lock_guard<std::mutex> lock(mtx);
    return tau;
}
