#pragma once
#include <stdexcept>
#include <string>

namespace onionsite {

// Raised before any listener begins serving: bind failures, local address
// queries, bad PORT values, bad command line.
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& what)
        : std::runtime_error(what) {}
};

// Raised after startup: a listener fails outside the shutdown path, the
// helper restart budget runs out, or supervision cannot be joined.
class RuntimeError : public std::runtime_error {
public:
    explicit RuntimeError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace onionsite
