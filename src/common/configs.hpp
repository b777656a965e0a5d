#ifndef CONFIGS_HPP
#define CONFIGS_HPP

#include <string>
#include <vector>
#include "enums.hpp"

// Consistent hashing
extern int VIRTUAL_NODES;
extern std::string HASH_FUNCTION;

// Health checking
extern double HEALTH_CHECK_INTERVAL_SEC;
extern double HEALTH_CHECK_TIMEOUT_SEC;
extern int HEALTH_CHECK_RETRIES;
extern ProbeType HEALTH_CHECK_TYPE;
extern std::string HEALTH_CHECK_PATH;
extern int HEALTH_CHECK_EXPECTED_STATUS;

// Management server
extern std::string LISTEN_ADDRESS;
extern int MAX_MESSAGE_SIZE;

// Servers registered at startup, "name,host,port[,weight]"
extern std::vector<std::string> INITIAL_SERVERS;

#endif // CONFIGS_HPP
