//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <optional>

#include "base.hpp"
#include "dynamic_problem.hpp"

// Common
class invalid_instance : public std::exception
{
  public:
    invalid_instance(){};

    const char *what() const throw()
    {
        return "instance is not valid";
    }
};

// Problem: Dynamic Multi-objective TSP

enum class TSPMatrix
{
    DISTANCE,
    COST
};

// An update of a single (symmetric) entry of either matrix of a TSP instance.
struct TSPMatrixData
{
    TSPMatrix matrix_id;
    size_t x;
    size_t y;
    double value;

    template <class Archive> void serialize(Archive &ar)
    {
        ar(matrix_id, x, y, value);
    }
};

// A bi-objective TSP instance: every edge has both a distance and a cost.
struct TSPInstance
{
    size_t num_cities;
    std::vector<std::vector<double>> distance;
    std::vector<std::vector<double>> cost;

    bool operator==(const TSPInstance &o) const
    {
        return num_cities == o.num_cities && distance == o.distance && cost == o.cost;
    }
};

// Common functions
double evaluate_tour(const std::vector<std::vector<double>> &matrix, const std::vector<size_t> &tour);
TSPInstance generate_euclidean_tsp_instance(size_t num_cities, Rng &rng);

class DynamicMultiObjectiveTSP : public DynamicProblem<TSPMatrixData>
{
    TSPInstance instance;

    struct Cache
    {
        TypedGetter<GenotypePermutation> ggp;
        TypedGetter<Objective> go;
    };
    std::optional<Cache> cache;

  protected:
    void validate(const TSPMatrixData &payload) override;
    void update(const TSPMatrixData &payload) override;

  public:
    DynamicMultiObjectiveTSP(TSPInstance instance);

    void evaluate(Individual i) override;

    void registerData() override;
    void afterRegisterData() override;

    std::string get_name() override;
    size_t get_number_of_objectives() override;
    size_t get_number_of_variables() override;

    TSPInstance get_instance();
};

// Problem: FDA2
//
// Two-objective continuous problem with a Pareto front whose shape changes over time.
// The payload is a time step counter `tau`: the problem time is (1 / n_t) * floor(tau / tau_t).
class FDA2 : public DynamicProblem<int>
{
    size_t l;
    int n_t;
    int tau_t;

    int tau = 0;
    double time = 0.0;

    struct Cache
    {
        TypedGetter<GenotypeContinuous> ggc;
        TypedGetter<Objective> go;
    };
    std::optional<Cache> cache;

  protected:
    void validate(const int &payload) override;
    void update(const int &payload) override;

  public:
    FDA2(size_t l = 31, int n_t = 10, int tau_t = 5);

    void evaluate(Individual i) override;

    void registerData() override;
    void afterRegisterData() override;

    std::string get_name() override;
    size_t get_number_of_objectives() override;
    size_t get_number_of_variables() override;

    double get_time();
    int get_tau();
};
