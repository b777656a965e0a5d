#include "utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <sstream>

bool ENABLE_FILE_LOGGING = true;
std::string FILE_LOGGING_PATH = "/tmp/ringlb";

static std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm localNow;
    localtime_r(&seconds, &localNow);

    char timestamp[32];
    size_t length = std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localNow);
    std::snprintf(timestamp + length, sizeof(timestamp) - length, ".%03lld", millis);
    return timestamp;
}

Logger::Logger(const std::string& name) : name(name) {
    if (!ENABLE_FILE_LOGGING) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(FILE_LOGGING_PATH, ec);
    if (ec) {
        std::cout << "Failed to create directory: " << FILE_LOGGING_PATH << " (" << ec.message() << ")" << std::endl;
    }

    path = FILE_LOGGING_PATH + "/" + name + ".log";
    file.open(path, std::ofstream::out | std::ofstream::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + path);
    }
}

void Logger::log_message(const std::string& message) {
    log_message(name, message);
}

void Logger::log_message(const std::string& component, const std::string& message) {
    if (!file.is_open()) {
        return;
    }
    std::string line = "[" + currentTimestamp() + "] [" + component + "] " + message;
    std::lock_guard<std::mutex> lock(fileMutex);
    file << line << std::endl;
    if (!file) {
        throw std::runtime_error("Failed to write log file: " + path);
    }
}

// Accepts host:port and [ipv6]:port
bool splitIpAddressAndPort(const std::string& input, std::string& ipAddress, int& port) {
    size_t colonPos = input.rfind(':');
    if (colonPos == std::string::npos) {
        return false;
    }

    std::string host = input.substr(0, colonPos);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string::npos) {
        // Bare IPv6 without brackets is ambiguous
        return false;
    }

    std::istringstream portStream(input.substr(colonPos + 1));
    int parsedPort;
    if (!(portStream >> parsedPort) || !portStream.eof()) {
        return false;
    }
    if (host.empty() || parsedPort <= 0 || parsedPort > 65535) {
        return false;
    }
    ipAddress = host;
    port = parsedPort;
    return true;
}

void splitString(const std::string& input, std::vector<std::string>& splits, char delimiter) {
    std::istringstream ss(input);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        splits.push_back(trimString(token));
    }
}

std::string trimString(const std::string& input) {
    const char* whitespace = " \t\r\n";
    size_t begin = input.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(whitespace);
    return input.substr(begin, end - begin + 1);
}

long long getCurrentTimeMillis() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return ts.tv_sec * 1000LL + ts.tv_nsec / 1000000;
}
