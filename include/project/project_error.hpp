#ifndef VBAUNLOCK_PROJECT_ERROR_HPP
#define VBAUNLOCK_PROJECT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vbaunlock::project {

class ProjectError : public std::runtime_error {
public:
    explicit ProjectError(const std::string& message)
        : std::runtime_error(message) {}
};

// Data Encryption version other than 2, or password bytes of no known layout
class UnrecognizedSchemeError : public ProjectError {
public:
    explicit UnrecognizedSchemeError(const std::string& message)
        : ProjectError("Unrecognized protection scheme: " + message) {}
};

class MalformedRecordError : public ProjectError {
public:
    explicit MalformedRecordError(const std::string& message)
        : ProjectError("Malformed protection record: " + message) {}
};

} // namespace vbaunlock::project

#endif // VBAUNLOCK_PROJECT_ERROR_HPP
