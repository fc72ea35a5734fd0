#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct TransportRequest {
  std::string url;
  std::string bearerToken; // sent as "Authorization: Bearer ..." if set
  // Ask the server to start at this byte offset (HTTP Range).
  std::uint64_t resumeFrom = 0;
  long connectTimeoutS = 10;
  // Give up if fewer than lowSpeedBytes/s arrive for lowSpeedTimeS seconds.
  long lowSpeedBytes = 1;
  long lowSpeedTimeS = 60;
};

struct TransportCallbacks {
  // Called once before the first body byte. `resumed` is true when the body
  // starts at the requested offset; `total` is the full resource size, 0 if
  // unknown. Return false to abort.
  std::function<bool(long status, bool resumed, std::uint64_t total)> onStart;
  // Return false to abort (write failure or cancellation).
  std::function<bool(const char *data, std::size_t len)> onData;
  // Polled between chunks; return false to abort.
  std::function<bool()> keepGoing;
};

struct TransportResult {
  bool ok = false;
  bool aborted = false; // a callback asked to stop
  long status = 0;      // HTTP status, 0 for file:// and friends
  std::string error;
};

// Streams one resource to the callbacks. fetch() blocks the calling thread.
class Transport {
public:
  virtual ~Transport() = default;
  virtual TransportResult fetch(const TransportRequest &req,
                                const TransportCallbacks &cb) = 0;
};
