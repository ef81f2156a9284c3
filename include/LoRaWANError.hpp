/**
 * @file LoRaWANError.hpp
 * @brief Exceptions raised for caller errors while building frames.
 *
 * Wireless noise (truncated frames, bad MICs, replayed counters) is never
 * reported through these types; it is dropped and logged. Exceptions are
 * reserved for values the caller should not have produced in the first place.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class of every exception thrown by the stack.
 */
class LoRaWANError : public std::runtime_error {
public:
    explicit LoRaWANError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A field value outside its protocol range, or an output buffer too small.
 */
class CodecError : public LoRaWANError {
public:
    enum Code {
        InvalidDataRate,
        InvalidTxPower,
        MarginOutOfRange,
        DelayOutOfRange,
        DutyCycleOutOfRange,
        MaxEirpOutOfRange,
        NanoSecondsOutOfRange,
        InvalidFrequency,
        InvalidIndex,
        BufferTooShort
    };

    CodecError(Code code, const std::string& what) : LoRaWANError(what), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

/**
 * @brief More outgoing MAC commands than a frame or the pending queue can hold.
 */
class CapacityError : public LoRaWANError {
public:
    explicit CapacityError(const std::string& what) : LoRaWANError(what) {}
};

/**
 * @brief The uplink frame counter is exhausted; a new join is required.
 */
class SessionExpiredError : public LoRaWANError {
public:
    SessionExpiredError() : LoRaWANError("Session expired: uplink frame counter exhausted") {}
};
