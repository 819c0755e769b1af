#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace docgate {

/**
 * @brief Root of the docgate exception hierarchy
 *
 * Wrapping failures (serialization, transport) keep the original exception
 * attached with std::throw_with_nested; use DescribeException() to flatten
 * the chain into one line for logging.
 */
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Invalid constructor or call arguments. Never retried.
class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& message) : Error(message) {}
};

// Document could not be encoded to (or decoded from) JSON.
class SerializationError : public Error {
 public:
  explicit SerializationError(const std::string& message) : Error(message) {}
};

// The network call failed: connection, timeout or malformed response.
class TransportError : public Error {
 public:
  explicit TransportError(const std::string& message) : Error(message) {}
};

// A blocked Acquire() was cancelled. No admission was consumed.
class InterruptedWait : public Error {
 public:
  explicit InterruptedWait(const std::string& message) : Error(message) {}
};

/**
 * @brief Flatten an exception and its nested causes
 *
 * Produces "outer: inner: innermost" for chains built with
 * std::throw_with_nested.
 */
std::string DescribeException(const std::exception& e);

}  // namespace docgate
