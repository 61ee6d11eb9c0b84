/**
 * @file exceptions.h
 * @brief Exception hierarchy for unexpected failures.
 *
 * These exceptions represent programming errors that cannot be handled
 * through normal control flow. Expected failures (bad ROMs, stack faults,
 * bad configuration) are reported through Result<T> instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chip8 {

/**
 * @brief Base class for all interpreter exceptions.
 */
class EmulatorException : public std::runtime_error {
public:
    explicit EmulatorException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Thrown when the machine is driven through a transition its
 * state machine does not allow and the caller cannot receive a Result.
 */
class IllegalMachineStateException : public EmulatorException {
public:
    explicit IllegalMachineStateException(const std::string& msg)
        : EmulatorException("Illegal machine state: " + msg)
    {}
};

/**
 * @brief Thrown when a configuration value is rejected outside a
 * Result-returning path (e.g. a preset built with bad dimensions).
 */
class ConfigException : public EmulatorException {
public:
    explicit ConfigException(const std::string& msg)
        : EmulatorException("Configuration error: " + msg)
    {}
};

} // namespace chip8
