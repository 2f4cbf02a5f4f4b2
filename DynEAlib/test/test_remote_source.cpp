#include <catch2/catch.hpp>

#include "problems.hpp"
#include "remote_source.hpp"

TEST_CASE("RemoteUpdateSource: updating a TSP instance from another process", "[Remote]")
{
    Rng rng(42);
    auto problem = std::make_shared<DynamicMultiObjectiveTSP>(generate_euclidean_tsp_instance(5, rng));

    RemoteUpdateSource<TSPMatrixData> source;
    source.getObservable().register_observer(problem);
    int port = 0;
    auto server = source.start_server("127.0.0.1:0", &port);
    REQUIRE(port != 0);

    RemoteUpdateClient client("127.0.0.1:" + std::to_string(port));

    SECTION("Updates are applied in the order they are pushed")
    {
        auto first = client.push(TSPMatrixData{TSPMatrix::COST, 1, 3, 17.0});
        auto second = client.push(TSPMatrixData{TSPMatrix::COST, 1, 3, 18.0});
        REQUIRE(first.sequence() == 0);
        REQUIRE(second.sequence() == 1);
        REQUIRE(first.failed_deliveries() == 0);

        auto instance = problem->get_instance();
        REQUIRE(instance.cost[1][3] == 18.0);
        REQUIRE(instance.cost[3][1] == 18.0);
        REQUIRE(problem->consume_change());
        REQUIRE(!problem->consume_change());
    }

    SECTION("A malformed update is reported, but does not reach the problem")
    {
        auto before = problem->get_instance();
        auto response = client.push(TSPMatrixData{TSPMatrix::DISTANCE, 1, 9, 17.0});
        REQUIRE(response.failed_deliveries() == 1);
        REQUIRE(problem->get_instance() == before);
        REQUIRE(!problem->has_changed());
    }

    SECTION("An unknown matrix identifier decodes, but is rejected by the problem")
    {
        auto before = problem->get_instance();
        auto response = client.push(TSPMatrixData{static_cast<TSPMatrix>(7), 0, 1, 5.0});
        REQUIRE(response.failed_deliveries() == 1);
        REQUIRE(problem->get_instance() == before);
        REQUIRE(!problem->has_changed());
    }

    SECTION("Bytes that cannot be decoded are rejected")
    {
        REQUIRE_THROWS_AS(client.push_raw("x"), remote_update_error);
        REQUIRE(!problem->has_changed());

        // The source remains available afterwards.
        auto response = client.push(TSPMatrixData{TSPMatrix::DISTANCE, 0, 1, 2.0});
        REQUIRE(response.sequence() == 0);
        REQUIRE(problem->has_changed());
    }

    server->Shutdown();
}

TEST_CASE("RemoteUpdateSource: time steps for FDA2", "[Remote]")
{
    auto problem = std::make_shared<FDA2>();
    RemoteUpdateSource<int> source;
    source.getObservable().register_observer(problem);
    int port = 0;
    auto server = source.start_server("127.0.0.1:0", &port);

    RemoteUpdateClient client("127.0.0.1:" + std::to_string(port));
    client.push(12);
    REQUIRE(problem->get_tau() == 12);
    REQUIRE(problem->get_time() == Approx(0.2));

    server->Shutdown();
}

TEST_CASE("RemoteUpdateClient: unreachable receiver", "[Remote]")
{
    RemoteUpdateClient client("127.0.0.1:1");
    REQUIRE_THROWS_AS(client.push(5), remote_update_error);
}
