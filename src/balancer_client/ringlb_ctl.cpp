#include <iostream>
#include <stdexcept>
#include <boost/program_options.hpp>

#include "balancer_client.hpp"

static void printServer(const ringlb::ServerInfo& server) {
    std::cout << server.server_id() << "\t" << server.host() << ":" << server.port()
              << "\tweight=" << server.weight()
              << "\tvnodes=" << server.virtual_node_count()
              << "\tstate=" << server.health().state()
              << "\trequests=" << server.stats().request_count()
              << "\terrors=" << server.stats().error_count()
              << "\tavg_latency_ms=" << server.stats().average_latency_ms() << std::endl;
}

static void runCommand(BalancerClient& client, const std::string& command, const boost::program_options::variables_map& vm) {
    auto require = [&vm, &command](const std::string& option) {
        if (!vm.count(option)) {
            throw std::runtime_error("Command '" + command + "' requires --" + option);
        }
    };

    if (command == "add") {
        require("host");
        require("port");
        std::string serverId = client.addServer(vm["name"].as<std::string>(), vm["host"].as<std::string>(),
                                                vm["port"].as<int>(), vm["weight"].as<int>());
        std::cout << "Added " << serverId << std::endl;
    } else if (command == "remove") {
        require("id");
        client.removeServer(vm["id"].as<std::string>());
        std::cout << "Removed " << vm["id"].as<std::string>() << std::endl;
    } else if (command == "weight") {
        require("id");
        client.updateWeight(vm["id"].as<std::string>(), vm["weight"].as<int>());
        std::cout << "Updated " << vm["id"].as<std::string>() << std::endl;
    } else if (command == "select") {
        require("key");
        ringlb::SelectServerResponse response = client.selectServer(vm["key"].as<std::string>());
        std::cout << response.server_id() << "\t" << response.host() << ":" << response.port() << std::endl;
    } else if (command == "report") {
        require("id");
        client.reportResult(vm["id"].as<std::string>(), !vm["failed"].as<bool>(), vm["latency"].as<double>());
    } else if (command == "up" || command == "down") {
        require("id");
        client.setServerHealth(vm["id"].as<std::string>(), command == "up");
    } else if (command == "list") {
        for (const ringlb::ServerInfo& server : client.getServerList()) {
            printServer(server);
        }
    } else if (command == "stats") {
        ringlb::GetAggregateStatsResponse stats = client.getAggregateStats();
        std::cout << "servers: " << stats.server_count() << " (" << stats.healthy_server_count() << " healthy)" << std::endl;
        std::cout << "ring: " << stats.ring_size() << " virtual nodes, " << stats.hash_function()
                  << ", " << stats.virtual_nodes() << " per weight unit" << std::endl;
        std::cout << "selections: " << stats.total_selections() << " (" << stats.failed_selections() << " failed)" << std::endl;
        std::cout << "requests: " << stats.total_requests() << ", errors: " << stats.total_errors()
                  << ", error rate: " << stats.error_rate() << std::endl;
        std::cout << "average latency (ms): " << stats.average_latency_ms() << std::endl;
    } else if (command == "reset") {
        client.resetStats();
    } else if (command == "lookup") {
        require("key");
        ringlb::DebugLookupResponse lookup = client.debugLookup(vm["key"].as<std::string>(), vm["count"].as<int>());
        std::cout << "key: " << lookup.key() << std::endl;
        std::cout << "hash: " << lookup.hash_value() << std::endl;
        std::cout << "primary: " << lookup.primary() << std::endl;
        for (int i = 0; i < lookup.candidates_size(); ++i) {
            std::cout << "candidate " << i << ": " << lookup.candidates(i) << std::endl;
        }
        std::cout << "selected: " << (lookup.has_selection() ? lookup.selected() : "(none healthy)") << std::endl;
    } else if (command == "ring") {
        ringlb::DebugRingResponse ring = client.debugRing(vm["count"].as<int>());
        std::cout << "virtual nodes: " << ring.total_virtual_nodes() << std::endl;
        for (const auto& entry : ring.virtual_node_counts()) {
            std::cout << "  " << entry.first << ": " << entry.second << std::endl;
        }
        for (const ringlb::VirtualNodeInfo& node : ring.sample()) {
            std::cout << node.hash_value() << "\t" << node.server_id() << "#" << node.replica_index() << std::endl;
        }
    } else {
        throw std::runtime_error("Unknown command: " + command);
    }
}

int main(int argc, char** argv) {
    boost::program_options::options_description desc("ringlb_ctl <add|remove|weight|select|report|up|down|list|stats|reset|lookup|ring> [options]");
    desc.add_options()
        ("help", "show this message")
        ("command", boost::program_options::value<std::string>(), "command to run")
        ("address", boost::program_options::value<std::string>()->default_value("localhost:50051"), "address of the balancer server")
        ("id", boost::program_options::value<std::string>(), "server id")
        ("name", boost::program_options::value<std::string>()->default_value(""), "server name (add)")
        ("host", boost::program_options::value<std::string>(), "server host (add)")
        ("port", boost::program_options::value<int>(), "server port (add)")
        ("weight", boost::program_options::value<int>()->default_value(1), "server weight (add, weight)")
        ("key", boost::program_options::value<std::string>(), "request key (select, lookup)")
        ("failed", boost::program_options::value<bool>()->default_value(false), "report a failed request (report)")
        ("latency", boost::program_options::value<double>()->default_value(0.0), "request latency in ms (report)")
        ("count", boost::program_options::value<int>()->default_value(3), "candidates (lookup) or sampled nodes (ring)");
    boost::program_options::positional_options_description positional;
    positional.add("command", 1);

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        boost::program_options::notify(vm);
    } catch (const boost::program_options::error& e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }
    if (vm.count("help") || !vm.count("command")) {
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 1;
    }

    try {
        BalancerClient client;
        client.connect(vm["address"].as<std::string>());
        runCommand(client, vm["command"].as<std::string>(), vm);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
