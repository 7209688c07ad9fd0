#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sdbx::cloud {

// Transport-level failure: no route, DNS, TLS, timeout, HTTP 429 or 5xx.
// Caught at connectivity boundaries and reported as a connection problem.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {}
};

// The server answered but rejected the request.
class ApiError : public std::runtime_error {
public:
    ApiError(const long status, std::string summary, const std::string& msg)
        : std::runtime_error(msg), status_(status), summary_(std::move(summary)) {}

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& summary() const { return summary_; }

private:
    long status_;
    std::string summary_;
};

}
