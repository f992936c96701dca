#pragma once

#include <string>

// Only FatalPrecondition stops a run; the other kinds are logged, counted and
// the run moves on to the next element or link.
enum class ErrorKind {
  FatalPrecondition,
  ConfigurationError,
  TransferFailure,
  LinkFailure
};

enum class ErrorCode {
  AlreadyRunning,
  LockIo,
  ToolMissing,
  DestinationUnreachable,
  InsufficientSpace,
  NoTerminal,
  PathTraversal,
  OutsideRoot,
  NoSyncList,
  MissingSource,
  TransferFailed,
  Timeout,
  Interrupted,
  MalformedRecord,
  UnsafeTarget,
  LinkCreation,
  ManifestTransfer
};

struct SyncError {
  ErrorKind kind = ErrorKind::TransferFailure;
  ErrorCode code = ErrorCode::TransferFailed;
  std::string message;

  bool fatal() const { return kind == ErrorKind::FatalPrecondition; }
};

inline SyncError make_error(ErrorKind kind, ErrorCode code, std::string message) {
  SyncError error;
  error.kind = kind;
  error.code = code;
  error.message = std::move(message);
  return error;
}

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::FatalPrecondition: return "fatal precondition";
    case ErrorKind::ConfigurationError: return "configuration error";
    case ErrorKind::TransferFailure: return "transfer failure";
    case ErrorKind::LinkFailure: return "link failure";
  }
  return "unknown";
}

inline const char* to_string(ErrorCode code) {
  switch(code) {
    case ErrorCode::AlreadyRunning: return "already-running";
    case ErrorCode::LockIo: return "lock-io";
    case ErrorCode::ToolMissing: return "tool-missing";
    case ErrorCode::DestinationUnreachable: return "destination-unreachable";
    case ErrorCode::InsufficientSpace: return "insufficient-space";
    case ErrorCode::NoTerminal: return "no-terminal";
    case ErrorCode::PathTraversal: return "path-traversal";
    case ErrorCode::OutsideRoot: return "outside-root";
    case ErrorCode::NoSyncList: return "no-sync-list";
    case ErrorCode::MissingSource: return "missing-source";
    case ErrorCode::TransferFailed: return "transfer-failed";
    case ErrorCode::Timeout: return "timeout";
    case ErrorCode::Interrupted: return "interrupted";
    case ErrorCode::MalformedRecord: return "malformed-record";
    case ErrorCode::UnsafeTarget: return "unsafe-target";
    case ErrorCode::LinkCreation: return "link-creation";
    case ErrorCode::ManifestTransfer: return "manifest-transfer";
  }
  return "unknown";
}
