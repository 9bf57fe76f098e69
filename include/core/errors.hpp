#pragma once

#include <stdexcept>
#include <string>

namespace rwc {

// Start-up precondition failure: screen capture permission is not granted
class PermissionDeniedError : public std::runtime_error {
public:
  explicit PermissionDeniedError(const std::string& what) : std::runtime_error(what) {}
};

// A single rasterization attempt failed. Transient; the source logs it and waits for the next tick
class CaptureFailure : public std::runtime_error {
public:
  explicit CaptureFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rwc
