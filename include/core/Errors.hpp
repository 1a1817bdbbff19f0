#pragma once

#include <stdexcept>
#include <string>

namespace podfetch {
namespace core {

// A substitution rule that does not follow the s<D>pattern<D>replacement<D> form
class MalformedRuleError : public std::runtime_error {
public:
    MalformedRuleError(const std::string& rule, const std::string& reason)
        : std::runtime_error("malformed rule '" + rule + "': " + reason), rule_(rule) {}

    const std::string& rule() const { return rule_; }

private:
    std::string rule_;
};

class FeedFetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transfer stopped because the run is shutting down
class TransferCancelledError : public TransferError {
public:
    TransferCancelledError() : TransferError("cancelled") {}
};

class StateWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace core
} // namespace podfetch
