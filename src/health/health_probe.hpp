#ifndef HEALTH_PROBE_HPP
#define HEALTH_PROBE_HPP

#include <chrono>
#include <memory>
#include <string>

#include "enums.hpp"

struct ProbeTarget {
    std::string host;
    int port;
};

struct ProbeResult {
    bool success;
    long long responseTimeMs;
    int statusCode; // -1 when no HTTP status was read
    std::string errorMessage;
};

// A single health-check attempt against one server. Implementations never throw
// for transport errors; they report them as a failed result.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual ProbeResult probe(const ProbeTarget& target, std::chrono::milliseconds timeout) = 0;
};

// Succeeds when a TCP connection is established within the timeout.
class TcpHealthProbe : public HealthProbe {
public:
    ProbeResult probe(const ProbeTarget& target, std::chrono::milliseconds timeout) override;
};

// Issues "GET <path>" and succeeds when the response status matches.
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(const std::string& path, int expectedStatus);

    ProbeResult probe(const ProbeTarget& target, std::chrono::milliseconds timeout) override;

    const std::string& getPath() const { return path; }
    int getExpectedStatus() const { return expectedStatus; }

private:
    std::string path;
    int expectedStatus;
};

std::shared_ptr<HealthProbe> createHealthProbe(ProbeType type, const std::string& path, int expectedStatus);

ProbeType parseProbeType(const std::string& name);

int parseHttpStatusLine(const std::string& response);

#endif // HEALTH_PROBE_HPP
