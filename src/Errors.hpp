/// @file
/// Exceptions raised by the cadastre pipeline.
///
/// - ConfigError: bad parameters, detected before any geometric work.
/// - MissingInputError: a named input layer is absent or has the wrong type.
/// - GeometryError: the geometry kernel failed or produced an invalid result.
/// - IoError: a shapefile or WKT file could not be read or written.
/// - Cancelled: the progress observer asked the pipeline to stop.  It is not
///   a runtime_error so that generic error handlers do not swallow it.

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace cadastre {

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
}; // ConfigError

class MissingInputError : public std::runtime_error {
public:
  MissingInputError(const std::string& what, std::vector<std::string> available);
  const std::vector<std::string>& available() const noexcept
    { return _available; }
private:
  std::vector<std::string> _available;
}; // MissingInputError

class GeometryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // GeometryError

class IoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // IoError

class Cancelled : public std::exception {
public:
  explicit Cancelled(int step) noexcept : _step{step} { }
  const char* what() const noexcept override
    { return "processing cancelled by user"; }
  int step() const noexcept { return _step; }
private:
  int _step;
}; // Cancelled

// Exit statuses of the parcelgen tool.
constexpr int ExitSuccess   = 0;
constexpr int ExitFailure   = 1;
constexpr int ExitUsage     = 2;   // command line or configuration
constexpr int ExitSaveError = 3;   // output dumped as WKT instead
constexpr int ExitCancelled = 130; // 128 + SIGINT

} // cadastre
