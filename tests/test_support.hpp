#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include "hash_functions.hpp"
#include "health_probe.hpp"

// Hashes keys through a fixed table so tests can place virtual nodes and keys
// at chosen ring positions. Keys missing from the table fall back to fnv1a.
class TableHashFunction : public HashFunction {
public:
    explicit TableHashFunction(const std::map<std::string, uint32_t>& table) : table(table) {}

    uint32_t hash(const std::string& key) const override {
        auto it = table.find(key);
        return it == table.end() ? fnv1aHash(key) : it->second;
    }

    std::string name() const override { return "table"; }

private:
    std::map<std::string, uint32_t> table;
};

class NarrowHashFunction : public HashFunction {
public:
    uint32_t hash(const std::string& key) const override { return fnv1aHash(key) & 0xffff; }

    int outputBits() const override { return 16; }

    std::string name() const override { return "narrow"; }
};

// Probe whose outcome per host is set by the test.
class ScriptedProbe : public HealthProbe {
public:
    ProbeResult probe(const ProbeTarget& target, std::chrono::milliseconds timeout) override {
        calls++;
        std::lock_guard<std::mutex> guard(mutex);
        auto it = outcomes.find(target.host);
        bool success = it == outcomes.end() ? defaultOutcome : it->second;
        return ProbeResult{success, responseTimeMs, success ? 200 : -1, success ? "" : "scripted failure"};
    }

    void setOutcome(const std::string& host, bool success) {
        std::lock_guard<std::mutex> guard(mutex);
        outcomes[host] = success;
    }

    void setDefaultOutcome(bool success) {
        std::lock_guard<std::mutex> guard(mutex);
        defaultOutcome = success;
    }

    void setResponseTime(long long millis) {
        std::lock_guard<std::mutex> guard(mutex);
        responseTimeMs = millis;
    }

    std::atomic<int> calls{0};

private:
    std::mutex mutex;
    std::map<std::string, bool> outcomes;
    bool defaultOutcome = true;
    long long responseTimeMs = 1;
};

#endif // TEST_SUPPORT_HPP
