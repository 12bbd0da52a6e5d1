#include "flooding.hpp"
#include "network.hpp"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{
    std::unique_ptr<wsnsim::Node> sensor(wsnsim::Scheduler &sched, wsnsim::Medium &medium, wsnsim::NodeId id, double x)
    {
        wsnsim::NodeConfig cfg;
        cfg.id = id;
        cfg.position = {x, 0.0};
        cfg.txRange = 2.0;
        return std::make_unique<wsnsim::Node>(sched, medium, cfg, std::make_unique<wsnsim::SensorBehavior>());
    }
}

int main()
{
    wsnsim::Scheduler sched;
    wsnsim::RandomStream rng(0);
    wsnsim::Network network;
    wsnsim::Medium medium(sched, network, rng);

    network.add_node(sensor(sched, medium, 5, 1.0));
    network.add_node(sensor(sched, medium, 3, 2.0));
    assert(network.size() == 2);
    assert(network.contains(5) && network.contains(3));
    assert(network.nodes()[0]->id() == 5);
    assert(network.get_node(3).radio().position.x == 2.0);
    assert(network.radio_of(5).txRange == 2.0);

    // Duplicate id.
    {
        bool threw = false;
        try
        {
            network.add_node(sensor(sched, medium, 5, 9.0));
        }
        catch (const wsnsim::DuplicateNodeError &e)
        {
            threw = true;
            assert(std::string(e.what()) == "node_id 5 already in use");
        }
        assert(threw);
        assert(network.size() == 2);
    }

    // Unknown id.
    {
        bool threw = false;
        try
        {
            (void)network.get_node(42);
        }
        catch (const wsnsim::NotFoundError &e)
        {
            threw = true;
            assert(std::string(e.what()) == "node_id 42 not found in the network");
        }
        assert(threw);

        threw = false;
        try
        {
            network.remove_node(42);
        }
        catch (const wsnsim::NotFoundError &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Removal before start; the id becomes free again.
    network.remove_node(3);
    assert(!network.contains(3));
    assert(network.size() == 1);
    network.add_node(sensor(sched, medium, 3, 4.0));
    assert(network.get_node(3).radio().position.x == 4.0);

    // Started nodes are attached to the medium and cannot be removed.
    network.start_all();
    assert(medium.endpoint_count() == 2);
    network.start_all();
    assert(medium.endpoint_count() == 2);
    {
        bool threw = false;
        try
        {
            network.remove_node(5);
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Id 0 is the broadcast address.
    {
        bool threw = false;
        try
        {
            sensor(sched, medium, wsnsim::BroadcastId, 0.0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
