#pragma once
#include <stdexcept>
#include <string>

namespace droneid {

// Invalid rate/gain/frequency/worker settings.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Serial number or UUID field holds bytes that are not valid text.
class TextDecodeError : public std::runtime_error {
public:
    explicit TextDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// The radio front end could not be opened or configured.
class RadioError : public std::runtime_error {
public:
    explicit RadioError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace droneid
