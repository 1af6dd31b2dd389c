#pragma once
#include <stdexcept>
#include <string>

namespace ps {

// Unwinding paths of a sync. ChunkStore itself reports failures as bool /
// std::nullopt; the orchestrator raises StorageError when a write it depends on fails.
class SyncError : public std::runtime_error {
public:
  explicit SyncError(const std::string& what) : std::runtime_error(what) {}
};

// Direct and proxy fetch both failed, or the provider fetch failed.
class NetworkError : public SyncError {
public:
  explicit NetworkError(const std::string& what) : SyncError(what) {}
};

// Cancellation observed at a read, batch or store boundary.
class CancelledError : public SyncError {
public:
  CancelledError() : SyncError("cancelled") {}
  explicit CancelledError(const std::string& what) : SyncError(what) {}
};

// A chunk write, move or delete needed by the running sync failed.
class StorageError : public SyncError {
public:
  explicit StorageError(const std::string& what) : SyncError(what) {}
};

}
