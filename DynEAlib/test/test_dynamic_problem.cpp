#include <catch2/catch.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

#include "dynamic_problem.hpp"
#include "problems.hpp"

static std::shared_ptr<DynamicMultiObjectiveTSP> make_tsp(size_t n, std::shared_ptr<Population> pop)
{
    Rng rng(42);
    auto problem = std::make_shared<DynamicMultiObjectiveTSP>(generate_euclidean_tsp_instance(n, rng));
    problem->setPopulation(pop);
    problem->registerData();
    problem->afterRegisterData();
    return problem;
}

TEST_CASE("Change tracking", "[DynamicProblem]")
{
    auto pop = std::make_shared<Population>();
    auto problem = make_tsp(5, pop);

    SECTION("A fresh problem is unchanged")
    {
        REQUIRE(!problem->has_changed());
        REQUIRE(!problem->consume_change());
    }

    SECTION("A single update is consumed exactly once")
    {
        problem->apply(TSPMatrixData{TSPMatrix::DISTANCE, 0, 1, 3.0});
        REQUIRE(problem->has_changed());
        REQUIRE(problem->has_changed());
        REQUIRE(problem->consume_change());
        REQUIRE(!problem->consume_change());
        REQUIRE(!problem->has_changed());
    }

    SECTION("Updates before a consume collapse into a single change, reflecting the latest")
    {
        problem->apply(TSPMatrixData{TSPMatrix::COST, 1, 2, 3.0});
        problem->apply(TSPMatrixData{TSPMatrix::COST, 1, 2, 4.0});
        REQUIRE(problem->consume_change());
        REQUIRE(!problem->consume_change());
        REQUIRE(problem->get_instance().cost[1][2] == 4.0);
    }

    SECTION("An update after a consume is a new change")
    {
        problem->apply(TSPMatrixData{TSPMatrix::COST, 1, 2, 3.0});
        REQUIRE(problem->consume_change());
        problem->apply(TSPMatrixData{TSPMatrix::COST, 1, 2, 3.0});
        REQUIRE(problem->consume_change());
    }

    SECTION("Receiving a value from a source applies it")
    {
        ObservedValue<TSPMatrixData> value{TSPMatrixData{TSPMatrix::DISTANCE, 3, 4, 10.0}, 0};
        problem->receive(value);
        REQUIRE(problem->consume_change());
        REQUIRE(problem->get_instance().distance[3][4] == 10.0);
    }
}

TEST_CASE("Malformed updates leave the problem untouched", "[DynamicProblem]")
{
    auto pop = std::make_shared<Population>();
    auto problem = make_tsp(5, pop);
    TSPInstance before = problem->get_instance();

    auto payload = GENERATE(TSPMatrixData{TSPMatrix::DISTANCE, 5, 1, 1.0},
                            TSPMatrixData{TSPMatrix::DISTANCE, 1, 7, 1.0},
                            TSPMatrixData{TSPMatrix::COST, 2, 2, 1.0},
                            TSPMatrixData{TSPMatrix::COST, 0, 1, -1.0},
                            TSPMatrixData{TSPMatrix::COST, 0, 1, std::numeric_limits<double>::quiet_NaN()},
                            TSPMatrixData{TSPMatrix::DISTANCE, 0, 1, std::numeric_limits<double>::infinity()},
                            TSPMatrixData{static_cast<TSPMatrix>(2), 0, 1, 5.0});

    REQUIRE_THROWS_AS(problem->apply(payload), malformed_update);
    REQUIRE(problem->get_instance() == before);
    REQUIRE(!problem->has_changed());
}

TEST_CASE("A pending change is not lost by a malformed update", "[DynamicProblem]")
{
    auto pop = std::make_shared<Population>();
    auto problem = make_tsp(5, pop);
    problem->apply(TSPMatrixData{TSPMatrix::DISTANCE, 0, 1, 1.0});
    REQUIRE_THROWS_AS(problem->apply(TSPMatrixData{TSPMatrix::DISTANCE, 0, 0, 1.0}), malformed_update);
    REQUIRE(problem->consume_change());
}

TEST_CASE("Concurrent updates and consumption never lose a change", "[DynamicProblem]")
{
    auto pop = std::make_shared<Population>();
    auto problem = make_tsp(5, pop);

    const size_t num_updates = 2000;
    std::atomic<size_t> applied{0};
    std::thread producer([&]() {
        for (size_t u = 0; u < num_updates; ++u)
        {
            problem->apply(TSPMatrixData{TSPMatrix::DISTANCE, 0, 1, static_cast<double>(u)});
            applied++;
        }
    });

    size_t consumed = 0;
    while (applied < num_updates)
    {
        if (problem->consume_change())
            consumed++;
    }
    producer.join();
    // Anything applied after the final consume of the loop above is still pending.
    if (problem->consume_change())
        consumed++;

    REQUIRE(consumed >= 1);
    REQUIRE(consumed <= num_updates);
    REQUIRE(!problem->has_changed());
    REQUIRE(problem->get_instance().distance[0][1] == static_cast<double>(num_updates - 1));
}

TEST_CASE("DynamicMultiObjectiveTSP", "[Problem]")
{
    auto pop = std::make_shared<Population>();
    TSPInstance instance{3,
                         {{0, 1, 2}, {1, 0, 3}, {2, 3, 0}},
                         {{0, 10, 20}, {10, 0, 30}, {20, 30, 0}}};
    auto problem = std::make_shared<DynamicMultiObjectiveTSP>(instance);
    problem->setPopulation(pop);
    problem->registerData();
    problem->afterRegisterData();

    REQUIRE(problem->get_name() == "DynamicMultiObjectiveTSP");
    REQUIRE(problem->get_number_of_objectives() == 2);
    REQUIRE(problem->get_number_of_variables() == 3);
    REQUIRE(pop->getGlobalData<GenotypePermutationData>()->l == 3);

    Individual ii = pop->newIndividual();
    pop->getData<GenotypePermutation>(ii).genotype = {0, 1, 2};

    SECTION("Both objectives are the length of the closed tour")
    {
        problem->evaluate(ii);
        auto &o = pop->getData<Objective>(ii).objectives;
        REQUIRE(o == std::vector<double>{6.0, 60.0});
    }

    SECTION("Updates are symmetric, and reflected in the next evaluation")
    {
        problem->apply(TSPMatrixData{TSPMatrix::DISTANCE, 2, 1, 5.0});
        REQUIRE(problem->get_instance().distance[1][2] == 5.0);
        REQUIRE(problem->get_instance().distance[2][1] == 5.0);
        problem->evaluate(ii);
        REQUIRE(pop->getData<Objective>(ii).objectives[0] == 8.0);
    }

    SECTION("An instance with mismatched matrices is invalid")
    {
        TSPInstance broken{3, {{0, 1}, {1, 0}}, instance.cost};
        REQUIRE_THROWS_AS(DynamicMultiObjectiveTSP(broken), invalid_instance);
    }
}

TEST_CASE("FDA2", "[Problem]")
{
    auto pop = std::make_shared<Population>();
    auto problem = std::make_shared<FDA2>(5, 10, 5);
    problem->setPopulation(pop);
    problem->registerData();
    problem->afterRegisterData();

    auto data = pop->getGlobalData<GenotypeContinuousData>();
    REQUIRE(data->l == 5);
    REQUIRE(data->lower[0] == 0.0);
    REQUIRE(data->lower[1] == -1.0);
    REQUIRE(data->upper[4] == 1.0);

    Individual ii = pop->newIndividual();

    SECTION("On the front, the second objective is 1 - f1^(1/H)")
    {
        // x_II = 0 gives g = 1, x_III = H gives the smallest exponent denominator.
        double h_t = 0.75;
        pop->getData<GenotypeContinuous>(ii).genotype = {0.25, 0.0, 0.0, h_t, h_t};
        problem->evaluate(ii);
        auto &o = pop->getData<Objective>(ii).objectives;
        REQUIRE(o[0] == Approx(0.25));
        REQUIRE(o[1] == Approx(1.0 - std::pow(0.25, 1.0 / h_t)));
    }

    SECTION("Time advances every tau_t steps")
    {
        problem->apply(4);
        REQUIRE(problem->get_time() == Approx(0.0));
        problem->apply(5);
        REQUIRE(problem->get_time() == Approx(0.1));
        problem->apply(12);
        REQUIRE(problem->get_time() == Approx(0.2));
        REQUIRE(problem->get_tau() == 12);
        REQUIRE(problem->consume_change());
    }

    SECTION("A negative time step is malformed")
    {
        problem->apply(10);
        REQUIRE(problem->consume_change());
        REQUIRE_THROWS_AS(problem->apply(-1), malformed_update);
        REQUIRE(problem->get_tau() == 10);
        REQUIRE(!problem->has_changed());
    }
}
