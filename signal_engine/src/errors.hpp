#pragma once

#include <stdexcept>
#include <string>

// Transient failure fetching from the market-data provider (network, 429, 5xx).
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& msg, int http_status = 0)
        : std::runtime_error(msg), http_status_(http_status) {}
    int http_status() const { return http_status_; }
private:
    int http_status_;
};

// The provider refused the request (4xx other than 429). Retrying cannot help.
class ProviderRejectedError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Expected bars are missing. Never synthesized.
class DataGapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single detector failed (threw or timed out) for one bar.
class DetectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Not enough future candles yet for a horizon. Deferred, not failed.
class LabelPendingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unique-key collision on a write. Callers treat it as an idempotent success.
class ConstraintViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed configuration, detector parameters or horizons. Fatal at startup.
class ConfigValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
