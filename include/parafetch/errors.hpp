#pragma once

#include <stdexcept>
#include <string>

namespace parafetch {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpStatusError : public TransportError {
public:
    explicit HttpStatusError(long status);

    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

} // namespace parafetch
