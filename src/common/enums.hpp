#ifndef ENUMS_H
#define ENUMS_H

enum HealthState {
    UNKNOWN = 0,
    HEALTHY = 1,
    UNHEALTHY = 2
};

enum HashAlgorithm {
    SIMPLE_HASH = 1,
    DJB2_HASH = 2,
    FNV1A_HASH = 3,
    MD5_HASH = 4,
    SHA1_HASH = 5,
    CRC32_HASH = 6,
    MURMUR3_HASH = 7
};

enum ProbeType {
    TCP_PROBE = 1,
    HTTP_PROBE = 2
};

enum ErrorKind {
    DUPLICATE_SERVER = 1,
    SERVER_NOT_FOUND = 2,
    INVALID_WEIGHT = 3,
    EMPTY_RING = 4,
    NO_SERVERS_AVAILABLE = 5,
    NO_HEALTHY_SERVER = 6
};

#endif // ENUMS_H
