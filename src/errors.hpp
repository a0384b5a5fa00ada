#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  Connection,
  Protocol,
  Integrity,
  NotFound,
  ExhaustedRetries,
  Init,
  InvalidArgument
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Connection: return "connection";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::Integrity: return "integrity";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::ExhaustedRetries: return "exhausted-retries";
    case ErrorKind::Init: return "init";
    case ErrorKind::InvalidArgument: return "invalid-argument";
  }
  return "unknown";
}

// Malformed or unrecognized frame. Never crosses a component boundary.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// The overlay could not be started.
class InitError : public std::runtime_error {
public:
  explicit InitError(const std::string& what) : std::runtime_error(what) {}
};

struct OperationResult {
  bool success = false;
  std::string error;
  ErrorKind kind = ErrorKind::None;

  static OperationResult ok() {
    OperationResult r;
    r.success = true;
    return r;
  }

  static OperationResult failure(ErrorKind kind, std::string error) {
    OperationResult r;
    r.kind = kind;
    r.error = std::move(error);
    return r;
  }
};
