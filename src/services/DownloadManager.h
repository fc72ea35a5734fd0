#pragma once

#include "../core/Constants.h"
#include "../core/Segment.h"
#include "../core/WorkerService.h"
#include "../network/Transport.h"
#include "LocalStorage.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class TransferState { Pending, Running, PausedByCancel, Completed, Failed };

enum class TransferError {
  None,
  Network,   // connection, HTTP or timeout failure; retry resumes
  Storage,   // local disk failure
  Integrity, // size or checksum mismatch
  Rejected   // not downloadable: unavailable, unsupported method, no token
};

const char *transferStateName(TransferState s);
const char *transferErrorName(TransferError e);

struct Transfer {
  std::uint64_t id = 0;
  std::string segmentId;
  std::uint64_t bytesReceived = 0;
  std::uint64_t bytesTotal = 0; // 0 while unknown
  TransferState state = TransferState::Pending;
  TransferError error = TransferError::None;
  std::string reason;
  int attempts = 0; // transfers started for this segment, this one included

  bool isTerminal() const {
    return state == TransferState::PausedByCancel ||
           state == TransferState::Completed || state == TransferState::Failed;
  }
};

struct DownloadConfig {
  std::filesystem::path rootDir;
  std::string nsidcToken;
  std::size_t maxConcurrent = QIceRadar::DEFAULT_MAX_CONCURRENT_TRANSFERS;
  long connectTimeoutS = QIceRadar::DEFAULT_CONNECT_TIMEOUT_S;
  long lowSpeedBytes = QIceRadar::DEFAULT_LOW_SPEED_BYTES;
  long lowSpeedTimeS = QIceRadar::DEFAULT_LOW_SPEED_TIME_S;
};

// Fetches segment files into the local root, one Transfer per segment at a
// time. Availability overrides and the per-segment Transfer slot live under
// one mutex, which is also where cancellation and completion are decided.
//
// Listeners run on the worker (or calling) thread with no lock held, so they
// may call back into the manager.
class DownloadManager {
public:
  using Listener = std::function<void(const Transfer &)>;

  DownloadManager(DownloadConfig config, std::shared_ptr<Transport> transport);
  ~DownloadManager();

  DownloadManager(const DownloadManager &) = delete;
  DownloadManager &operator=(const DownloadManager &) = delete;

  // Returns the id of the segment's active Transfer if there is one,
  // otherwise starts a new one. Rejections and already-downloaded files
  // produce a Transfer that is terminal on return.
  std::uint64_t start(const Segment &segment);

  // Starts a new attempt after a failure or cancel. A leftover partial file
  // is resumed with a Range request.
  std::uint64_t retry(const Segment &segment);

  // Returns false if the Transfer is unknown, already terminal, or has
  // received every byte and is being verified. A cancel that races with the
  // last byte loses: the transfer completes and the segment becomes local.
  bool cancel(std::uint64_t transferId);

  // Returns false if the Transfer is unknown.
  bool progress(std::uint64_t transferId, std::uint64_t &received,
                std::uint64_t &total) const;
  bool transfer(std::uint64_t transferId, Transfer &out) const;

  // Every Transfer started so far, oldest first.
  std::vector<Transfer> transfers() const;

  // Current availability, taking this session's transfers and the local
  // root into account.
  Availability availability(const Segment &segment) const;

  // Blocks until the Transfer is terminal or the timeout expires. Returns
  // true if it is terminal.
  bool waitFor(std::uint64_t transferId, std::chrono::milliseconds timeout);

  int subscribe(Listener listener);
  void unsubscribe(int token);

  const LocalStorage &storage() const { return storage_; }

private:
  struct Slot {
    Transfer transfer;
    Segment segment;
    bool cancelRequested = false;
    // Every byte has arrived; cancel() no longer applies.
    bool finalizing = false;
    std::chrono::steady_clock::time_point lastNotify;
  };

  void run(std::shared_ptr<Slot> slot);
  std::string rejectReason(const Segment &segment) const;
  bool verify(const Slot &slot, std::uint64_t reportedTotal,
              std::string &err) const;

  // Caller holds mutex_. Moves the slot to a terminal state and releases
  // the segment.
  void finish(Slot &slot, TransferState state, TransferError error,
              const std::string &reason);
  void notify(const Transfer &t);

  DownloadConfig config_;
  std::shared_ptr<Transport> transport_;
  LocalStorage storage_;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::uint64_t nextId_ = 1;
  std::map<std::uint64_t, std::shared_ptr<Slot>> slots_;
  std::map<std::string, std::uint64_t> active_;
  std::map<std::string, Availability> availability_;
  std::map<std::string, int> attempts_;

  std::mutex listenerMutex_;
  int nextListener_ = 1;
  std::map<int, Listener> listeners_;

  WorkerService pool_;
};
