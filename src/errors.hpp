#pragma once

#include <stdexcept>
#include <string>

// Transport failure or an unexpected short response from a byte source.
class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string& what) : std::runtime_error(what) {}
};

// Local filesystem write or index persistence failure. Never retried.
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class CancelledError : public std::runtime_error {
public:
  CancelledError() : std::runtime_error("Cancelled") {}
  explicit CancelledError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
