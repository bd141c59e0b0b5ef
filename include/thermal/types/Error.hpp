#pragma once
#include <stdexcept>
#include <string>

namespace thermal::types {

class DriverException : public std::runtime_error {
public:
    explicit DriverException(const std::string& msg)
        : std::runtime_error(msg) {}
};

class ConfigException : public DriverException {
public:
    explicit ConfigException(const std::string& msg)
        : DriverException("Invalid configuration: " + msg) {}
};

class ReceiptFormatException : public DriverException {
public:
    explicit ReceiptFormatException(const std::string& msg)
        : DriverException("Invalid receipt: " + msg) {}
};

class LinkOpenException : public DriverException {
public:
    LinkOpenException(const std::string& device, const std::string& reason)
        : DriverException("Cannot open printer link on " + device + ": " + reason) {}
};

}
