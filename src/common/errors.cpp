#include "errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case DUPLICATE_SERVER:
            return "DuplicateServer";
        case SERVER_NOT_FOUND:
            return "ServerNotFound";
        case INVALID_WEIGHT:
            return "InvalidWeight";
        case EMPTY_RING:
            return "EmptyRing";
        case NO_SERVERS_AVAILABLE:
            return "NoServersAvailable";
        case NO_HEALTHY_SERVER:
            return "NoHealthyServer";
    }
    return "Unknown";
}
