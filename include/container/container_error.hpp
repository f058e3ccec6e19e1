#ifndef VBAUNLOCK_CONTAINER_ERROR_HPP
#define VBAUNLOCK_CONTAINER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vbaunlock::container {

class ContainerError : public std::runtime_error {
public:
    explicit ContainerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad header: magic, byte order, sector sizes or allocation table location
class CorruptContainerError : public ContainerError {
public:
    explicit CorruptContainerError(const std::string& message)
        : ContainerError("Corrupt container: " + message) {}
};

class BrokenChainError : public ContainerError {
public:
    explicit BrokenChainError(const std::string& message)
        : ContainerError("Broken sector chain: " + message) {}
};

class ChainTooShortError : public ContainerError {
public:
    explicit ChainTooShortError(const std::string& message)
        : ContainerError("Chain too short: " + message) {}
};

class MissingRootError : public ContainerError {
public:
    explicit MissingRootError(const std::string& message)
        : ContainerError("Missing root entry: " + message) {}
};

class StreamNotFoundError : public ContainerError {
public:
    explicit StreamNotFoundError(const std::string& message)
        : ContainerError("Stream not found: " + message) {}
};

} // namespace vbaunlock::container

#endif // VBAUNLOCK_CONTAINER_ERROR_HPP
