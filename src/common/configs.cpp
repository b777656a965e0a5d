#include "configs.hpp"
#include "enums.hpp"
#include <string>
#include <vector>


int VIRTUAL_NODES = 100;
std::string HASH_FUNCTION = "fnv1a";

double HEALTH_CHECK_INTERVAL_SEC = 10.0;
double HEALTH_CHECK_TIMEOUT_SEC = 2.0;
int HEALTH_CHECK_RETRIES = 3;
ProbeType HEALTH_CHECK_TYPE = ProbeType::HTTP_PROBE;
std::string HEALTH_CHECK_PATH = "/health";
int HEALTH_CHECK_EXPECTED_STATUS = 200;

std::string LISTEN_ADDRESS = "[::]:50051";
int MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

std::vector<std::string> INITIAL_SERVERS = {};
