#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>
#include <limits>

#include "initializers.hpp"
#include "mocks_base_ea.hpp"
#include "restart.hpp"

static std::shared_ptr<Population> make_population()
{
    auto pop = std::make_shared<Population>();
    pop->registerData<Objective>();
    pop->registerData<GenotypePermutation>();
    pop->registerGlobalData(GenotypePermutationData{5});
    pop->registerGlobalData(Rng(42));
    return pop;
}

static std::vector<Individual> make_individuals(Population &pop, std::vector<std::vector<double>> objectives)
{
    std::vector<Individual> iis;
    for (auto &o : objectives)
    {
        Individual ii = pop.newIndividual();
        pop.getData<Objective>(ii).objectives = o;
        iis.push_back(ii);
    }
    return iis;
}

static std::vector<std::vector<double>> objectives_of(Population &pop, std::vector<Individual> &iis)
{
    std::vector<std::vector<double>> result;
    for (auto ii : iis)
        result.push_back(pop.getData<Objective>(ii).objectives);
    return result;
}

static void setup(IDataUser &user, std::shared_ptr<Population> pop)
{
    user.setPopulation(pop);
    user.registerData();
    user.afterRegisterData();
}

TEST_CASE("hypervolume", "[Restart]")
{
    SECTION("A single point spans a box up to the reference point")
    {
        REQUIRE(hypervolume({{0.5, 0.5}}, {1.0, 1.0}) == Approx(0.25));
        REQUIRE(hypervolume({{0.0, 0.0, 0.0}}, {1.0, 1.0, 1.0}) == Approx(1.0));
    }
    SECTION("Overlap is counted once")
    {
        REQUIRE(hypervolume({{0.0, 0.5}, {0.5, 0.0}}, {1.0, 1.0}) == Approx(0.75));
        REQUIRE(hypervolume({{0.0, 0.0, 0.5}, {0.5, 0.5, 0.0}}, {1.0, 1.0, 1.0}) == Approx(0.625));
    }
    SECTION("Points beyond the reference point contribute nothing")
    {
        REQUIRE(hypervolume({{1.5, 0.0}}, {1.0, 1.0}) == 0.0);
        REQUIRE(hypervolume({}, {1.0, 1.0}) == 0.0);
    }
}

TEST_CASE("crowding_distances", "[Restart]")
{
    auto d = crowding_distances({{0.0, 1.0}, {0.1, 0.9}, {0.5, 0.5}, {1.0, 0.0}});
    REQUIRE(d[0] == std::numeric_limits<double>::infinity());
    REQUIRE(d[1] == Approx(1.0));
    REQUIRE(d[2] == Approx(1.8));
    REQUIRE(d[3] == std::numeric_limits<double>::infinity());
}

TEST_CASE("RestartStrategy preserves the size of the population", "[Restart]")
{
    auto pop = make_population();
    auto initializer = std::make_shared<PermutationUniformInitializer>();
    size_t n = GENERATE(0, 3, 10, 50);
    size_t population_size = GENERATE(1, 10);

    std::shared_ptr<IRemoveSolutions> remover;
    int kind = GENERATE(0, 1, 2, 3);
    switch (kind)
    {
    case 0:
        remover = std::make_shared<RemoveFirstNSolutions>(n);
        break;
    case 1:
        remover = std::make_shared<RemoveNRandomSolutions>(n);
        break;
    case 2:
        remover = std::make_shared<RemoveNSolutionsAccordingToTheHypervolumeContribution>(n);
        break;
    default:
        remover = std::make_shared<RemoveNSolutionsAccordingToTheCrowdingDistance>(n);
        break;
    }
    RestartStrategy strategy(remover, std::make_shared<CreateNRandomSolutions>(initializer));
    setup(strategy, pop);

    std::vector<std::vector<double>> objectives;
    for (size_t i = 0; i < population_size; ++i)
        objectives.push_back({static_cast<double>(i), static_cast<double>(population_size - i)});
    auto iis = make_individuals(*pop, objectives);

    strategy.restart(iis);
    REQUIRE(iis.size() == population_size);
    REQUIRE(pop->active() == population_size);

    // Newly created solutions are initialized, and not evaluated.
    size_t num_new = 0;
    for (auto ii : iis)
    {
        if (pop->getData<Objective>(ii).objectives.empty())
        {
            num_new++;
            REQUIRE(pop->getData<GenotypePermutation>(ii).genotype.size() == 5);
        }
    }
    REQUIRE(num_new == std::min(n, population_size));
}

TEST_CASE("RestartStrategy failures", "[Restart]")
{
    auto pop = make_population();

    SECTION("Restarting an empty population is an error")
    {
        RestartStrategy strategy(std::make_shared<RemoveFirstNSolutions>(1),
                                 std::make_shared<CreateNRandomSolutions>(std::make_shared<PermutationUniformInitializer>()));
        setup(strategy, pop);
        std::vector<Individual> iis;
        REQUIRE_THROWS_AS(strategy.restart(iis), restart_policy_error);
    }

    SECTION("A creation policy that creates too few solutions is an error")
    {
        using trompeloeil::_;
        auto remover = std::make_shared<RemoveFirstNSolutions>(2);
        auto creator = std::make_shared<MockCreateSolutions>();
        ALLOW_CALL(*creator, setPopulation(_));
        ALLOW_CALL(*creator, registerData());
        ALLOW_CALL(*creator, afterRegisterData());
        RestartStrategy strategy(remover, creator);
        setup(strategy, pop);

        auto iis = make_individuals(*pop, {{0.0}, {1.0}, {2.0}});
        REQUIRE_CALL(*creator, create(_, 2U)).LR_SIDE_EFFECT(_1.push_back(pop->newIndividual()));
        REQUIRE_THROWS_AS(strategy.restart(iis), restart_policy_error);
    }

    SECTION("The removal policy is asked to remove the configured number of solutions")
    {
        using trompeloeil::_;
        auto remover = std::make_shared<MockRemoveSolutions>(7);
        auto creator = std::make_shared<MockCreateSolutions>();
        ALLOW_CALL(*creator, setPopulation(_));
        ALLOW_CALL(*creator, registerData());
        ALLOW_CALL(*creator, afterRegisterData());
        RestartStrategy strategy(remover, creator);
        setup(strategy, pop);

        auto iis = make_individuals(*pop, {{0.0}, {1.0}});
        trompeloeil::sequence s;
        REQUIRE_CALL(*remover, remove(_, 7U)).IN_SEQUENCE(s).RETURN(0);
        REQUIRE_CALL(*creator, create(_, 0U)).IN_SEQUENCE(s);
        strategy.restart(iis);
        REQUIRE(iis.size() == 2);
    }
}

TEST_CASE("RemoveFirstNSolutions", "[Restart]")
{
    auto pop = make_population();
    RemoveFirstNSolutions remover(2);
    setup(remover, pop);
    auto iis = make_individuals(*pop, {{0.0}, {1.0}, {2.0}});

    REQUIRE(remover.remove(iis, 2) == 2);
    REQUIRE(objectives_of(*pop, iis) == std::vector<std::vector<double>>{{2.0}});
    REQUIRE(pop->active() == 1);

    // Never removes more than present.
    REQUIRE(remover.remove(iis, 5) == 1);
    REQUIRE(iis.empty());
}

TEST_CASE("RemoveNRandomSolutions is deterministic for a fixed seed", "[Restart]")
{
    auto remove_with_seed = [](size_t seed) {
        auto pop = make_population();
        pop->registerGlobalData(Rng(seed));
        RemoveNRandomSolutions remover(5);
        setup(remover, pop);
        std::vector<std::vector<double>> objectives;
        for (size_t i = 0; i < 20; ++i)
            objectives.push_back({static_cast<double>(i)});
        auto iis = make_individuals(*pop, objectives);
        REQUIRE(remover.remove(iis, 5) == 5);
        REQUIRE(iis.size() == 15);
        return objectives_of(*pop, iis);
    };

    REQUIRE(remove_with_seed(1) == remove_with_seed(1));
}

TEST_CASE("RemoveNSolutionsAccordingToTheHypervolumeContribution", "[Restart]")
{
    auto pop = make_population();
    RemoveNSolutionsAccordingToTheHypervolumeContribution remover(1);
    setup(remover, pop);

    SECTION("The least contributing solution is removed")
    {
        auto iis = make_individuals(*pop, {{0.0, 1.0}, {0.48, 0.52}, {0.5, 0.5}, {1.0, 0.0}});
        REQUIRE(remover.remove(iis, 1) == 1);
        REQUIRE(objectives_of(*pop, iis) == std::vector<std::vector<double>>{{0.0, 1.0}, {0.5, 0.5}, {1.0, 0.0}});
    }

    SECTION("Dominated solutions go first, ties are broken by the lowest position")
    {
        auto iis = make_individuals(*pop, {{0.0, 1.0}, {0.5, 0.5}, {1.0, 0.0}, {0.9, 0.9}});
        REQUIRE(remover.remove(iis, 2) == 2);
        REQUIRE(objectives_of(*pop, iis) == std::vector<std::vector<double>>{{0.5, 0.5}, {1.0, 0.0}});
    }

    SECTION("Unevaluated solutions cannot be ranked")
    {
        auto iis = make_individuals(*pop, {{0.0, 1.0}, {}});
        REQUIRE_THROWS_AS(remover.remove(iis, 1), assertion_failure);
    }
}

TEST_CASE("RemoveNSolutionsAccordingToTheCrowdingDistance", "[Restart]")
{
    auto pop = make_population();
    RemoveNSolutionsAccordingToTheCrowdingDistance remover(1);
    setup(remover, pop);

    auto iis = make_individuals(*pop, {{0.0, 1.0}, {0.1, 0.9}, {0.5, 0.5}, {1.0, 0.0}});
    REQUIRE(remover.remove(iis, 1) == 1);
    REQUIRE(objectives_of(*pop, iis) == std::vector<std::vector<double>>{{0.0, 1.0}, {0.5, 0.5}, {1.0, 0.0}});
}

TEST_CASE("CreateNSolutionsFromArchive", "[Restart]")
{
    auto pop = make_population();
    auto archive = std::make_shared<BruteforceArchive>(std::vector<size_t>{0, 1});
    CreateNSolutionsFromArchive creator(archive);
    setup(creator, pop);
    std::vector<Individual> iis;

    SECTION("An empty archive cannot provide solutions")
    {
        REQUIRE_THROWS_AS(creator.create(iis, 1), restart_policy_error);
    }

    SECTION("Archived solutions are copied, cycling through the archive")
    {
        auto candidates = make_individuals(*pop, {{0.0, 1.0}, {1.0, 0.0}});
        for (auto ii : candidates)
            archive->try_add(ii);

        creator.create(iis, 3);
        REQUIRE(objectives_of(*pop, iis) == std::vector<std::vector<double>>{{0.0, 1.0}, {1.0, 0.0}, {0.0, 1.0}});
        // Copies are independent of the archive.
        REQUIRE(archive->get_archived().size() == 2);
        REQUIRE(iis[0] != archive->get_archived()[0]);
    }
}
