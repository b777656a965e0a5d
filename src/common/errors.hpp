#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

#include "enums.hpp"

// Errors surfaced by the ring, the health monitor and the load balancer.
class BalancerError : public std::runtime_error {
public:
    BalancerError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind(kind) {}

    ErrorKind getKind() const { return kind; }

private:
    ErrorKind kind;
};

const char* errorKindName(ErrorKind kind);

#endif // ERRORS_HPP
