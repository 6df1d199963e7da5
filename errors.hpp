#pragma once

#include <stdexcept>
#include <string>

namespace topology {

// Raised for anything that makes the topology unusable before a process is
// started: bad JSON, an inconsistent route table, an unusable router command.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace topology
