#pragma once

#include <stdexcept>
#include <string>

// Base for every domain failure raised by the core
class QuantixError : public std::runtime_error {
public:
    explicit QuantixError(const std::string& what) : std::runtime_error(what) {}
};

// Candle window too short for structure analysis. The caller waits for more data.
class DataInsufficient : public QuantixError {
public:
    DataInsufficient(std::size_t required, std::size_t actual)
        : QuantixError("Insufficient candles: need " + std::to_string(required) +
                       ", got " + std::to_string(actual)),
          required_(required), actual_(actual) {}

    std::size_t required() const { return required_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t required_;
    std::size_t actual_;
};

// Transient candle feed failure, retried on the next tick
class FeedUnavailable : public QuantixError {
public:
    using QuantixError::QuantixError;
};

// Candle breaking the OHLC invariant or the time ordering
class MalformedCandle : public QuantixError {
public:
    using QuantixError::QuantixError;
};

// Broken entry/tp/sl relationship or an illegal state transition
class InvariantViolation : public QuantixError {
public:
    using QuantixError::QuantixError;
};

// Non-terminal signal past the administrative staleness threshold
class StaleSignal : public QuantixError {
public:
    using QuantixError::QuantixError;
};
