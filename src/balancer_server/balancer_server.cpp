#include <iostream>
#include <boost/program_options.hpp>

#include "balancer_server.hpp"
#include "configs.hpp"
#include "hash_functions.hpp"
#include "health_probe.hpp"
#include "utils.hpp"

std::string NAME = "BalancerServer";
Logger* logger;

int main(int argc, char** argv) {
    std::string healthCheckType;
    std::string configPath;
    boost::program_options::options_description desc("Balancer server options");
    desc.add_options()
        ("help", "show this message")
        ("config", boost::program_options::value<std::string>(&configPath), "path to an INI config file")
        ("virtual_nodes", boost::program_options::value<int>(&VIRTUAL_NODES)->default_value(VIRTUAL_NODES), "virtual nodes per unit of weight")
        ("hash_function", boost::program_options::value<std::string>(&HASH_FUNCTION)->default_value(HASH_FUNCTION), "simple, djb2, fnv1a, md5, sha1, crc32 or murmur3")
        ("health_check.interval", boost::program_options::value<double>(&HEALTH_CHECK_INTERVAL_SEC)->default_value(HEALTH_CHECK_INTERVAL_SEC), "seconds between probes of one server")
        ("health_check.timeout", boost::program_options::value<double>(&HEALTH_CHECK_TIMEOUT_SEC)->default_value(HEALTH_CHECK_TIMEOUT_SEC), "probe timeout (seconds)")
        ("health_check.retries", boost::program_options::value<int>(&HEALTH_CHECK_RETRIES)->default_value(HEALTH_CHECK_RETRIES), "consecutive failures before a server is unhealthy")
        ("health_check.type", boost::program_options::value<std::string>(&healthCheckType)->default_value("http"), "tcp or http")
        ("health_check.path", boost::program_options::value<std::string>(&HEALTH_CHECK_PATH)->default_value(HEALTH_CHECK_PATH), "HTTP probe path")
        ("health_check.expected_status", boost::program_options::value<int>(&HEALTH_CHECK_EXPECTED_STATUS)->default_value(HEALTH_CHECK_EXPECTED_STATUS), "HTTP status a healthy server answers with")
        ("listen_address", boost::program_options::value<std::string>(&LISTEN_ADDRESS)->default_value(LISTEN_ADDRESS), "gRPC listen address")
        ("server", boost::program_options::value<std::vector<std::string>>(&INITIAL_SERVERS)->composing(), "backend as name,host,port[,weight] (repeatable)")
        ("log_dir", boost::program_options::value<std::string>(&FILE_LOGGING_PATH)->default_value(FILE_LOGGING_PATH), "log directory")
        ("file_logging", boost::program_options::value<bool>(&ENABLE_FILE_LOGGING)->default_value(ENABLE_FILE_LOGGING), "write log files");
    boost::program_options::variables_map vm;
    try {
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            // Command-line values were stored first and take precedence
            boost::program_options::store(boost::program_options::parse_config_file<char>(vm["config"].as<std::string>().c_str(), desc), vm);
        }
        boost::program_options::notify(vm);
    } catch (const boost::program_options::error& e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    try {
        HEALTH_CHECK_TYPE = parseProbeType(healthCheckType);
        parseHashAlgorithm(HASH_FUNCTION);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    logger = new Logger(NAME);
    std::cout << "virtual_nodes: " << VIRTUAL_NODES << std::endl;
    std::cout << "hash_function: " << HASH_FUNCTION << std::endl;
    std::cout << "health_check: " << healthCheckType << " every " << HEALTH_CHECK_INTERVAL_SEC << "s, timeout "
              << HEALTH_CHECK_TIMEOUT_SEC << "s, retries " << HEALTH_CHECK_RETRIES << std::endl;
    std::cout << "listen_address: " << LISTEN_ADDRESS << std::endl;
    std::cout << "log_dir: " << FILE_LOGGING_PATH << (ENABLE_FILE_LOGGING ? "" : " (disabled)") << std::endl;

    LoadBalancerOptions options;
    options.virtualNodes = VIRTUAL_NODES;
    options.hashFunction = HASH_FUNCTION;
    options.healthCheck.intervalSec = HEALTH_CHECK_INTERVAL_SEC;
    options.healthCheck.timeoutSec = HEALTH_CHECK_TIMEOUT_SEC;
    options.healthCheck.retries = HEALTH_CHECK_RETRIES;

    try {
        auto probe = createHealthProbe(HEALTH_CHECK_TYPE, HEALTH_CHECK_PATH, HEALTH_CHECK_EXPECTED_STATUS);
        auto balancer = std::make_shared<LoadBalancer>(options, probe);
        for (const std::string& spec : INITIAL_SERVERS) {
            std::string serverId = balancer->addServer(parseServerSpec(spec));
            std::cout << "server: " << serverId << std::endl;
        }
        balancer->startHealthChecks();
        logger->log_message(NAME, "Start running gRPC server of the balancer");
        serve(balancer);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        logger->log_message(NAME, std::string("Fatal: ") + e.what());
        return 1;
    }
    return 0;
}
