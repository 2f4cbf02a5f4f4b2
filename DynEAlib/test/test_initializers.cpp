#include <catch2/catch.hpp>
#include <algorithm>
#include <numeric>
#include "initializers.hpp"

TEST_CASE("PermutationUniformInitializer", "[Operator][Initialization]")
{
    size_t l = 10;
    size_t population_size = 64;

    auto population = std::make_shared<Population>();
    auto init = PermutationUniformInitializer();
    // Perform registration routine.
    init.setPopulation(population);
    population->registerGlobalData(GenotypePermutationData{l});
    population->registerData<GenotypePermutation>();
    population->registerGlobalData(Rng(42));
    init.registerData();
    init.afterRegisterData();
    std::vector<Individual> iis(population_size);
    std::generate(iis.begin(), iis.end(), [&population]() { return population->newIndividual(); });
    init.initialize(iis);

    SECTION("All solutions should be permutations of the right size")
    {
        std::vector<size_t> identity(l);
        std::iota(identity.begin(), identity.end(), 0);
        for (auto ii : iis)
        {
            auto genotype = population->getData<GenotypePermutation>(ii).genotype;
            REQUIRE(genotype.size() == l);
            std::sort(genotype.begin(), genotype.end());
            REQUIRE(genotype == identity);
        }
    }

    SECTION("Not all solutions should be the same")
    {
        auto &first = population->getData<GenotypePermutation>(iis[0]).genotype;
        bool any_different = false;
        for (auto ii : iis)
            any_different |= population->getData<GenotypePermutation>(ii).genotype != first;
        REQUIRE(any_different);
    }
}

TEST_CASE("PermutationUniformInitializer requires a permutation genotype", "[Operator][Initialization]")
{
    auto population = std::make_shared<Population>();
    auto init = PermutationUniformInitializer();
    init.setPopulation(population);
    population->registerGlobalData(Rng(42));
    init.registerData();
    REQUIRE_THROWS_AS(init.afterRegisterData(), assertion_failure);
}

TEST_CASE("ContinuousUniformInitializer", "[Operator][Initialization]")
{
    size_t l = 4;
    size_t population_size = 256;

    auto population = std::make_shared<Population>();
    auto init = ContinuousUniformInitializer();
    init.setPopulation(population);
    population->registerGlobalData(GenotypeContinuousData{l, {0.0, -1.0, -1.0, 5.0}, {1.0, 1.0, 1.0, 6.0}});
    population->registerData<GenotypeContinuous>();
    population->registerGlobalData(Rng(42));
    init.registerData();
    init.afterRegisterData();
    std::vector<Individual> iis(population_size);
    std::generate(iis.begin(), iis.end(), [&population]() { return population->newIndividual(); });
    init.initialize(iis);

    SECTION("All variables should be within bounds")
    {
        auto data = population->getGlobalData<GenotypeContinuousData>();
        for (auto ii : iis)
        {
            auto &genotype = population->getData<GenotypeContinuous>(ii).genotype;
            REQUIRE(genotype.size() == l);
            for (size_t v = 0; v < l; ++v)
            {
                REQUIRE(genotype[v] >= data->lower[v]);
                REQUIRE(genotype[v] <= data->upper[v]);
            }
        }
    }

    SECTION("Values should be spread over the range")
    {
        bool seen_negative = false;
        bool seen_positive = false;
        for (auto ii : iis)
        {
            double v = population->getData<GenotypeContinuous>(ii).genotype[1];
            seen_negative |= v < 0.0;
            seen_positive |= v > 0.0;
        }
        REQUIRE(seen_negative);
        REQUIRE(seen_positive);
    }
}

TEST_CASE("ContinuousUniformInitializer requires a bound for every variable", "[Operator][Initialization]")
{
    auto population = std::make_shared<Population>();
    auto init = ContinuousUniformInitializer();
    init.setPopulation(population);
    population->registerGlobalData(GenotypeContinuousData{3, {0.0}, {1.0}});
    population->registerData<GenotypeContinuous>();
    population->registerGlobalData(Rng(42));
    init.registerData();
    REQUIRE_THROWS_AS(init.afterRegisterData(), assertion_failure);
}
