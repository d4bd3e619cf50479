#include "replay_bridge/fatal_error.hpp"
#include <sstream>

namespace {

std::string baseName(const char* file) {
    std::string path(file);
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

}

FatalError::FatalError(const std::string& operation,
                       const std::string& message,
                       const char* file,
                       int line)
    : std::runtime_error(message)
    , operation(operation)
{
    if (file) {
        location = baseName(file) + ":" + std::to_string(line);
    }
}

std::string FatalError::describe() const {
    std::ostringstream ss;
    if (!location.empty()) {
        ss << location << ": ";
    }
    if (!operation.empty()) {
        ss << operation << ": ";
    }
    ss << what();
    return ss.str();
}
