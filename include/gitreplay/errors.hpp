#pragma once
#include <stdexcept>
#include <string>

namespace gitreplay {

// Base of every error the library throws. Callers that only care about
// "something went wrong" catch this (or std::exception).
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Branch does not resolve to a commit during extraction.
class RefNotFound : public Error {
public:
  using Error::Error;
};

// Filesystem failure while writing a snapshot or the export layout.
class ExportIOError : public Error {
public:
  using Error::Error;
};

// Date/offset that cannot be represented as an ISO-8601 calendar instant.
class InvalidTimestamp : public Error {
public:
  using Error::Error;
};

// Malformed or unreadable manifest / commit record.
class ManifestDecodeError : public Error {
public:
  using Error::Error;
};

// The engine refused to create a commit (bad identity, write failure).
class CommitCreationError : public Error {
public:
  using Error::Error;
};

// A record lists a parent that no earlier record produced.
class DanglingParentReference : public Error {
public:
  using Error::Error;
};

// Replay was asked to rebuild from a manifest without commits.
class EmptyManifest : public Error {
public:
  using Error::Error;
};

// Clearing or populating the replay working area failed.
class WorkdirIOError : public Error {
public:
  using Error::Error;
};

// Missing, corrupt or unsupported object in the object store.
class ObjectError : public Error {
public:
  using Error::Error;
};

// Bad settings file line or command-line override.
class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace gitreplay
