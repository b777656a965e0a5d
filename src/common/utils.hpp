#ifndef UTILS_HPP
#define UTILS_HPP

#include <iostream>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

extern bool ENABLE_FILE_LOGGING;
extern std::string FILE_LOGGING_PATH;

// Appends timestamped lines to <FILE_LOGGING_PATH>/<name>.log.
class Logger {
public:
    Logger(const std::string& name);

    void log_message(const std::string& message);
    void log_message(const std::string& component, const std::string& message);

    const std::string& getPath() const { return path; }

private:
    std::string name;
    std::string path;
    std::ofstream file;
    std::mutex fileMutex;
};

bool splitIpAddressAndPort(const std::string& input, std::string& ipAddress, int& port);
void splitString(const std::string& input, std::vector<std::string>& splits, char delimiter = ',');
std::string trimString(const std::string& input);
long long getCurrentTimeMillis();

#endif // UTILS_HPP
