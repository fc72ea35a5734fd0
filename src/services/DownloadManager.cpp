#include "DownloadManager.h"
#include "../core/Logger.h"
#include "../core/StringUtils.h"

#include <stdexcept>

namespace {

// Progress events are rate limited; terminal states always go out.
constexpr auto kNotifyInterval = std::chrono::milliseconds(100);

} // namespace

const char *transferStateName(TransferState s) {
  switch (s) {
  case TransferState::Pending:
    return "pending";
  case TransferState::Running:
    return "running";
  case TransferState::PausedByCancel:
    return "paused-by-cancel";
  case TransferState::Completed:
    return "completed";
  case TransferState::Failed:
    return "failed";
  }
  return "failed";
}

const char *transferErrorName(TransferError e) {
  switch (e) {
  case TransferError::None:
    return "none";
  case TransferError::Network:
    return "network";
  case TransferError::Storage:
    return "storage";
  case TransferError::Integrity:
    return "integrity";
  case TransferError::Rejected:
    return "rejected";
  }
  return "none";
}

DownloadManager::DownloadManager(DownloadConfig config,
                                 std::shared_ptr<Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)),
      storage_(config_.rootDir), pool_(config_.maxConcurrent, "Download") {
  if (!transport_)
    throw std::invalid_argument("DownloadManager: no transport");
}

DownloadManager::~DownloadManager() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &kv : active_)
      slots_[kv.second]->cancelRequested = true;
  }
  pool_.stop();
}

std::string DownloadManager::rejectReason(const Segment &segment) const {
  if (segment.availability == Availability::Unavailable)
    return "Segment " + segment.id + " is not available for download";
  const std::string method = StringUtils::toLower(segment.downloadMethod);
  if (method != "wget" && method != "nsidc")
    return "Download method '" + segment.downloadMethod +
           "' is not supported for " + segment.id;
  if (segment.remote.url.empty())
    return "No download URL for " + segment.id;
  if (segment.remote.credential == CredentialClass::BearerToken &&
      config_.nsidcToken.empty())
    return "An NSIDC token is required to download " + segment.id;
  if (config_.rootDir.empty())
    return "No root data directory configured";
  try {
    storage_.finalPath(segment);
  } catch (const std::invalid_argument &e) {
    return e.what();
  }
  return "";
}

std::uint64_t DownloadManager::start(const Segment &segment) {
  Transfer snapshot;
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto act = active_.find(segment.id);
    if (act != active_.end())
      return act->second;

    slot = std::make_shared<Slot>();
    slot->segment = segment;
    Transfer &t = slot->transfer;
    t.id = nextId_++;
    t.segmentId = segment.id;
    t.bytesTotal = segment.remote.sizeBytes;
    t.attempts = ++attempts_[segment.id];
    slots_[t.id] = slot;

    std::string reason = rejectReason(segment);
    if (!reason.empty()) {
      t.state = TransferState::Failed;
      t.error = TransferError::Rejected;
      t.reason = reason;
      LOG_W("DownloadManager", "{}", reason);
    } else if (storage_.isComplete(segment)) {
      std::error_code ec;
      auto size = std::filesystem::file_size(storage_.finalPath(segment), ec);
      t.state = TransferState::Completed;
      t.bytesReceived = ec ? 0 : size;
      t.bytesTotal = t.bytesReceived;
      availability_[segment.id] = Availability::AvailableLocal;
      LOG_I("DownloadManager", "{} is already downloaded", segment.id);
    } else {
      active_[segment.id] = t.id;
      availability_[segment.id] = Availability::Downloading;
    }
    snapshot = t;
  }

  // Listeners see the Pending state before the worker can move it on
  notify(snapshot);
  if (!snapshot.isTerminal()) {
    LOG_I("DownloadManager", "Queued transfer {} for {} from {}", snapshot.id,
          segment.id, segment.remote.url);
    if (!pool_.submitTask([this, slot] { run(slot); })) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        finish(*slot, TransferState::Failed, TransferError::Storage,
               "Download queue is shutting down");
        snapshot = slot->transfer;
      }
      notify(snapshot);
    }
  }
  changed_.notify_all();
  return snapshot.id;
}

std::uint64_t DownloadManager::retry(const Segment &segment) {
  LOG_I("DownloadManager", "Retrying {} ({} bytes already on disk)",
        segment.id, storage_.partialSize(segment));
  return start(segment);
}

bool DownloadManager::cancel(std::uint64_t transferId) {
  Transfer snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(transferId);
    if (it == slots_.end() || it->second->transfer.isTerminal() ||
        it->second->finalizing)
      return false;
    Slot &slot = *it->second;
    slot.cancelRequested = true;
    // A running worker acknowledges at its next chunk or progress tick.
    if (slot.transfer.state != TransferState::Pending)
      return true;
    storage_.discardPartial(slot.segment);
    finish(slot, TransferState::PausedByCancel, TransferError::None,
           "Cancelled");
    snapshot = slot.transfer;
  }
  notify(snapshot);
  changed_.notify_all();
  return true;
}

void DownloadManager::finish(Slot &slot, TransferState state,
                             TransferError error, const std::string &reason) {
  Transfer &t = slot.transfer;
  t.state = state;
  t.error = error;
  t.reason = reason;
  active_.erase(t.segmentId);
  availability_[t.segmentId] = state == TransferState::Completed
                                   ? Availability::AvailableLocal
                                   : Availability::AvailableRemote;
  if (state == TransferState::Failed)
    LOG_W("DownloadManager", "Transfer {} ({}) failed [{}]: {}", t.id,
          t.segmentId, transferErrorName(error), reason);
  else
    LOG_I("DownloadManager", "Transfer {} ({}) {}", t.id, t.segmentId,
          transferStateName(state));
}

void DownloadManager::run(std::shared_ptr<Slot> slot) {
  const Segment &seg = slot->segment;
  Transfer snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot->transfer.isTerminal())
      return;
    if (slot->cancelRequested)
      finish(*slot, TransferState::PausedByCancel, TransferError::None,
             "Cancelled");
    else
      slot->transfer.state = TransferState::Running;
    slot->lastNotify = std::chrono::steady_clock::now();
    snapshot = slot->transfer;
  }
  notify(snapshot);
  if (snapshot.isTerminal()) {
    changed_.notify_all();
    return;
  }

  std::uint64_t offset = storage_.partialSize(seg);
  if (seg.remote.sizeBytes > 0 && offset > seg.remote.sizeBytes)
    offset = 0;

  PartialFile file;
  std::string storageErr;
  std::uint64_t reportedTotal = 0;
  TransportResult result;

  if (seg.remote.sizeBytes > 0 && offset == seg.remote.sizeBytes) {
    // A previous attempt got every byte but did not finish
    result.ok = file.open(storage_.partialPath(seg), false, storageErr);
    if (result.ok) {
      std::lock_guard<std::mutex> lock(mutex_);
      slot->transfer.bytesReceived = offset;
    }
  } else {
    TransportRequest req;
    req.url = seg.remote.url;
    if (seg.remote.credential == CredentialClass::BearerToken)
      req.bearerToken = config_.nsidcToken;
    req.resumeFrom = offset;
    req.connectTimeoutS = config_.connectTimeoutS;
    req.lowSpeedBytes = config_.lowSpeedBytes;
    req.lowSpeedTimeS = config_.lowSpeedTimeS;

    TransportCallbacks cb;
    cb.onStart = [&](long status, bool resumed, std::uint64_t total) {
      if (!resumed && offset > 0)
        LOG_I("DownloadManager", "Server ignored range for {} (HTTP {}), "
              "restarting from zero", seg.id, status);
      if (!file.open(storage_.partialPath(seg), !resumed, storageErr))
        return false;
      reportedTotal = total;
      std::lock_guard<std::mutex> lock(mutex_);
      slot->transfer.bytesReceived = file.size();
      if (slot->transfer.bytesTotal == 0)
        slot->transfer.bytesTotal = total;
      return !slot->cancelRequested;
    };
    cb.onData = [&](const char *data, std::size_t len) {
      if (!file.write(data, len, storageErr))
        return false;
      bool emit = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->cancelRequested)
          return false;
        slot->transfer.bytesReceived = file.size();
        auto now = std::chrono::steady_clock::now();
        if (now - slot->lastNotify >= kNotifyInterval) {
          slot->lastNotify = now;
          snapshot = slot->transfer;
          emit = true;
        }
      }
      if (emit)
        notify(snapshot);
      return true;
    };
    cb.keepGoing = [&] {
      std::lock_guard<std::mutex> lock(mutex_);
      return !slot->cancelRequested;
    };

    result = transport_->fetch(req, cb);
  }

  // Decide the race with cancel() once. A transfer the cancel actually
  // stopped is cancelled; one whose data all arrived goes on to completion.
  const bool delivered = storageErr.empty() && result.ok;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t expected = seg.remote.sizeBytes > 0
                                       ? seg.remote.sizeBytes
                                       : reportedTotal;
    const bool shortOfData =
        expected > 0 && slot->transfer.bytesReceived < expected;
    if (slot->cancelRequested && (!delivered || shortOfData)) {
      file.close();
      storage_.discardPartial(seg);
      finish(*slot, TransferState::PausedByCancel, TransferError::None,
             "Cancelled");
      snapshot = slot->transfer;
    } else if (delivered) {
      slot->finalizing = true;
    }
  }
  if (snapshot.isTerminal()) {
    notify(snapshot);
    changed_.notify_all();
    return;
  }

  std::string err;
  TransferState state = TransferState::Completed;
  TransferError error = TransferError::None;

  if (!storageErr.empty()) {
    state = TransferState::Failed;
    error = TransferError::Storage;
    err = storageErr;
  } else if (!result.ok) {
    state = TransferState::Failed;
    error = TransferError::Network;
    err = result.error;
  } else if (!file.commit(err)) {
    state = TransferState::Failed;
    error = TransferError::Storage;
  } else if (!verify(*slot, reportedTotal, err)) {
    state = TransferState::Failed;
    error = TransferError::Integrity;
  }
  file.close();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state != TransferState::Completed) {
      if (error == TransferError::Integrity)
        storage_.discardPartial(seg);
      finish(*slot, state, error, err);
    } else if (!storage_.promote(seg, err)) {
      finish(*slot, TransferState::Failed, TransferError::Storage, err);
    } else {
      std::error_code ec;
      auto size = std::filesystem::file_size(storage_.finalPath(seg), ec);
      if (!ec) {
        slot->transfer.bytesReceived = size;
        slot->transfer.bytesTotal = size;
      }
      finish(*slot, TransferState::Completed, TransferError::None, "");
    }
    snapshot = slot->transfer;
  }
  notify(snapshot);
  changed_.notify_all();
}

bool DownloadManager::verify(const Slot &slot, std::uint64_t reportedTotal,
                             std::string &err) const {
  const Segment &seg = slot.segment;
  const auto path = storage_.partialPath(seg);

  std::error_code ec;
  const std::uint64_t actual = std::filesystem::file_size(path, ec);
  if (ec) {
    err = "cannot stat " + path.string() + ": " + ec.message();
    return false;
  }

  const std::uint64_t expected =
      seg.remote.sizeBytes > 0 ? seg.remote.sizeBytes : reportedTotal;
  if (expected > 0 && actual != expected) {
    err = "size mismatch: expected " + std::to_string(expected) + " bytes, got " +
          std::to_string(actual);
    return false;
  }

  if (seg.remote.checksum.empty())
    return true;

  std::string algorithm, digest;
  if (!StringUtils::splitChecksum(seg.remote.checksum, algorithm, digest)) {
    err = "malformed checksum '" + seg.remote.checksum + "'";
    return false;
  }
  std::string hex;
  if (!LocalStorage::fileDigest(path, StringUtils::toLower(algorithm), hex,
                                err))
    return false;
  if (hex != StringUtils::toLower(digest)) {
    err = algorithm + " mismatch: expected " + digest + ", got " + hex;
    return false;
  }
  return true;
}

bool DownloadManager::progress(std::uint64_t transferId,
                               std::uint64_t &received,
                               std::uint64_t &total) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(transferId);
  if (it == slots_.end())
    return false;
  received = it->second->transfer.bytesReceived;
  total = it->second->transfer.bytesTotal;
  return true;
}

bool DownloadManager::transfer(std::uint64_t transferId, Transfer &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(transferId);
  if (it == slots_.end())
    return false;
  out = it->second->transfer;
  return true;
}

std::vector<Transfer> DownloadManager::transfers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Transfer> out;
  out.reserve(slots_.size());
  for (const auto &kv : slots_)
    out.push_back(kv.second->transfer);
  return out;
}

Availability DownloadManager::availability(const Segment &segment) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = availability_.find(segment.id);
    if (it != availability_.end())
      return it->second;
  }
  if (segment.availability == Availability::Unavailable)
    return Availability::Unavailable;
  if (!config_.rootDir.empty()) {
    try {
      if (storage_.isComplete(segment))
        return Availability::AvailableLocal;
    } catch (const std::invalid_argument &e) {
      LOG_W("DownloadManager", "{}", e.what());
    }
  }
  return Availability::AvailableRemote;
}

bool DownloadManager::waitFor(std::uint64_t transferId,
                              std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_.wait_for(lock, timeout, [&] {
    auto it = slots_.find(transferId);
    return it == slots_.end() || it->second->transfer.isTerminal();
  });
}

int DownloadManager::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  int token = nextListener_++;
  listeners_[token] = std::move(listener);
  return token;
}

void DownloadManager::unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  listeners_.erase(token);
}

void DownloadManager::notify(const Transfer &t) {
  std::vector<Listener> copy;
  {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    for (const auto &kv : listeners_)
      copy.push_back(kv.second);
  }
  for (const auto &l : copy)
    l(t);
}
