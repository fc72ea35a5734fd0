#include <catch2/catch_test_macros.hpp>

#include "network/NetworkManager.h"
#include "services/DownloadManager.h"
#include "test_support.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <vector>

namespace download_manager {

using namespace std::chrono_literals;

constexpr std::size_t kNever = std::numeric_limits<std::size_t>::max();
constexpr std::size_t kChunk = 10000;

std::string makeBody(std::size_t n) {
  std::string body(n, '\0');
  for (std::size_t i = 0; i < n; ++i)
    body[i] = static_cast<char>('a' + i % 23);
  return body;
}

// Serves one in-memory body in fixed chunks. Can drop the connection or
// hold still at a given byte offset.
class ScriptedTransport : public Transport {
public:
  explicit ScriptedTransport(std::string body) : body_(std::move(body)) {}

  std::size_t failAt = kNever;
  std::size_t pauseAt = kNever;
  bool honourRange = true;

  TransportResult fetch(const TransportRequest &req,
                        const TransportCallbacks &cb) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(req);
    }
    TransportResult result;
    const bool resumed = honourRange && req.resumeFrom > 0;
    std::size_t pos = resumed ? static_cast<std::size_t>(req.resumeFrom) : 0;
    result.status = resumed ? 206 : 200;

    if (!cb.onStart(result.status, resumed, body_.size())) {
      result.aborted = true;
      return result;
    }
    while (pos < body_.size()) {
      if (pos == pauseAt)
        holdUntilReleased();
      if (!cb.keepGoing()) {
        result.aborted = true;
        return result;
      }
      if (pos >= failAt) {
        result.error = "Connection reset by peer";
        return result;
      }
      const std::size_t n = std::min(kChunk, body_.size() - pos);
      if (!cb.onData(body_.data() + pos, n)) {
        result.aborted = true;
        return result;
      }
      pos += n;
    }
    // Every byte is out; a cancel arriving now is too late
    if (pos == pauseAt)
      holdUntilReleased();
    result.ok = true;
    return result;
  }

  // Blocks until the transfer reaches pauseAt.
  bool waitUntilPaused() {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, 5s, [this] { return paused_; });
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  std::vector<TransportRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

private:
  void holdUntilReleased() {
    std::unique_lock<std::mutex> lock(mutex_);
    paused_ = true;
    cv_.notify_all();
    cv_.wait_for(lock, 10s, [this] { return released_; });
  }

  std::string body_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool paused_ = false;
  bool released_ = false;
  std::vector<TransportRequest> requests_;
};

Segment makeSegment(std::uint64_t size) {
  Segment seg;
  seg.id = "UTIG_ICECAP_JKB2h_F16T01a_001";
  seg.institution = "UTIG";
  seg.downloadMethod = "wget";
  seg.relativePath = "UTIG/ICECAP/F16T01a_001.nc";
  seg.remote.url = "https://example.org/F16T01a_001.nc";
  seg.remote.sizeBytes = size;
  return seg;
}

struct TestSubject {
  test_support::TempDir dir;
  std::shared_ptr<ScriptedTransport> transport;
  std::unique_ptr<DownloadManager> manager;

  explicit TestSubject(std::string body, std::string token = "",
                       std::size_t maxConcurrent =
                           QIceRadar::DEFAULT_MAX_CONCURRENT_TRANSFERS) {
    transport = std::make_shared<ScriptedTransport>(std::move(body));
    DownloadConfig cfg;
    cfg.rootDir = dir.path();
    cfg.nsidcToken = std::move(token);
    cfg.maxConcurrent = maxConcurrent;
    manager = std::make_unique<DownloadManager>(cfg, transport);
  }

  Transfer finish(std::uint64_t id) {
    REQUIRE(manager->waitFor(id, 10s));
    Transfer t;
    REQUIRE(manager->transfer(id, t));
    return t;
  }
};

TEST_CASE("A download lands at its final path", "[download]") {
  const std::string body = makeBody(250000);
  TestSubject t(body);
  Segment seg = makeSegment(body.size());

  std::mutex eventsMutex;
  std::condition_variable eventsCv;
  std::vector<Transfer> events;
  t.manager->subscribe([&](const Transfer &tr) {
    {
      std::lock_guard<std::mutex> lock(eventsMutex);
      events.push_back(tr);
    }
    eventsCv.notify_all();
  });

  CHECK(t.manager->availability(seg) == Availability::AvailableRemote);
  const auto id = t.manager->start(seg);
  Transfer done = t.finish(id);

  CHECK(done.state == TransferState::Completed);
  CHECK(done.error == TransferError::None);
  CHECK(done.bytesReceived == body.size());
  CHECK(done.bytesTotal == body.size());
  CHECK(t.manager->availability(seg) == Availability::AvailableLocal);

  const LocalStorage &storage = t.manager->storage();
  CHECK(test_support::readFile(storage.finalPath(seg)) == body);
  CHECK_FALSE(std::filesystem::exists(storage.partialPath(seg)));

  // The terminal event may still be on its way from the worker
  std::unique_lock<std::mutex> lock(eventsMutex);
  REQUIRE(eventsCv.wait_for(lock, 5s, [&] {
    return !events.empty() && events.back().isTerminal();
  }));
  CHECK(events.front().bytesReceived == 0);
  CHECK(events.back().state == TransferState::Completed);
  for (std::size_t i = 1; i < events.size(); ++i)
    CHECK(events[i - 1].bytesReceived <= events[i].bytesReceived);
}

TEST_CASE("Cancel mid-transfer leaves the segment remote", "[download]") {
  const std::string body = makeBody(1000000);
  TestSubject t(body);
  t.transport->pauseAt = 400000;
  Segment seg = makeSegment(body.size());

  const auto id = t.manager->start(seg);
  REQUIRE(t.transport->waitUntilPaused());

  std::uint64_t received = 0, total = 0;
  REQUIRE(t.manager->progress(id, received, total));
  CHECK(received == 400000);
  CHECK(total == 1000000);
  CHECK(t.manager->availability(seg) == Availability::Downloading);

  // Asking again while running attaches to the same transfer
  CHECK(t.manager->start(seg) == id);

  CHECK(t.manager->cancel(id));
  t.transport->release();
  Transfer done = t.finish(id);

  CHECK(done.state == TransferState::PausedByCancel);
  CHECK(t.manager->availability(seg) == Availability::AvailableRemote);
  CHECK_FALSE(std::filesystem::exists(t.manager->storage().finalPath(seg)));
  CHECK_FALSE(t.manager->cancel(id));
  CHECK_FALSE(t.manager->cancel(12345));
}

TEST_CASE("A cancel after the last byte loses to completion", "[download]") {
  const std::string body = makeBody(300000);
  TestSubject t(body);
  t.transport->pauseAt = body.size();
  Segment seg = makeSegment(body.size());

  const auto id = t.manager->start(seg);
  REQUIRE(t.transport->waitUntilPaused());
  // Still inside the transport, so the request is accepted
  CHECK(t.manager->cancel(id));
  t.transport->release();
  Transfer done = t.finish(id);

  CHECK(done.state == TransferState::Completed);
  CHECK(done.error == TransferError::None);
  CHECK(done.bytesReceived == body.size());
  CHECK(t.manager->availability(seg) == Availability::AvailableLocal);
  CHECK(test_support::readFile(t.manager->storage().finalPath(seg)) == body);
  CHECK_FALSE(t.manager->cancel(id));
}

TEST_CASE("Cancelling a queued transfer", "[download]") {
  const std::string body = makeBody(200000);
  TestSubject t(body, "", 1);
  t.transport->pauseAt = 100000;
  Segment first = makeSegment(body.size());
  Segment second = makeSegment(body.size());
  second.id = "UTIG_ICECAP_JKB2h_F16T01a_002";
  second.relativePath = "UTIG/ICECAP/F16T01a_002.nc";

  const auto firstId = t.manager->start(first);
  REQUIRE(t.transport->waitUntilPaused());

  // The only worker is busy, so the second transfer waits its turn
  test_support::writeFile(t.manager->storage().partialPath(second),
                          std::string(5000, 'Z'));
  const auto secondId = t.manager->start(second);
  Transfer queued;
  REQUIRE(t.manager->transfer(secondId, queued));
  CHECK(queued.state == TransferState::Pending);

  CHECK(t.manager->cancel(secondId));
  Transfer cancelled;
  REQUIRE(t.manager->transfer(secondId, cancelled));
  CHECK(cancelled.state == TransferState::PausedByCancel);
  CHECK(t.manager->availability(second) == Availability::AvailableRemote);
  CHECK(t.manager->storage().partialSize(second) == 0);
  CHECK_FALSE(t.manager->cancel(secondId));

  t.transport->release();
  CHECK(t.finish(firstId).state == TransferState::Completed);
  CHECK(t.finish(secondId).state == TransferState::PausedByCancel);
  CHECK(t.transport->requests().size() == 1);
}

TEST_CASE("A dropped connection can be resumed", "[download]") {
  const std::string body = makeBody(500000);
  TestSubject t(body);
  t.transport->failAt = 300000;
  Segment seg = makeSegment(body.size());

  Transfer first = t.finish(t.manager->start(seg));
  CHECK(first.state == TransferState::Failed);
  CHECK(first.error == TransferError::Network);
  CHECK(first.reason == "Connection reset by peer");
  CHECK(t.manager->availability(seg) == Availability::AvailableRemote);
  CHECK(t.manager->storage().partialSize(seg) == 300000);

  t.transport->failAt = kNever;
  Transfer second = t.finish(t.manager->retry(seg));
  CHECK(second.state == TransferState::Completed);
  CHECK(second.attempts == 2);
  CHECK(second.id != first.id);

  auto requests = t.transport->requests();
  REQUIRE(requests.size() == 2);
  CHECK(requests[0].resumeFrom == 0);
  CHECK(requests[1].resumeFrom == 300000);
  CHECK(test_support::readFile(t.manager->storage().finalPath(seg)) == body);
  CHECK(t.manager->transfers().size() == 2);
}

TEST_CASE("A server that ignores the range starts over", "[download]") {
  const std::string body = makeBody(100000);
  TestSubject t(body);
  t.transport->honourRange = false;
  Segment seg = makeSegment(body.size());

  test_support::writeFile(t.manager->storage().partialPath(seg),
                          std::string(40000, 'Z'));
  Transfer done = t.finish(t.manager->start(seg));

  CHECK(done.state == TransferState::Completed);
  REQUIRE(t.transport->requests().size() == 1);
  CHECK(t.transport->requests()[0].resumeFrom == 40000);
  CHECK(test_support::readFile(t.manager->storage().finalPath(seg)) == body);
}

TEST_CASE("Integrity failures discard the download", "[download]") {
  SECTION("Size mismatch") {
    const std::string body = makeBody(90000);
    TestSubject t(body);
    Segment seg = makeSegment(100000);

    Transfer done = t.finish(t.manager->start(seg));
    CHECK(done.state == TransferState::Failed);
    CHECK(done.error == TransferError::Integrity);
    CHECK(t.manager->availability(seg) == Availability::AvailableRemote);
    CHECK_FALSE(t.manager->storage().isComplete(seg));
    CHECK(t.manager->storage().partialSize(seg) == 0);
  }
  SECTION("Checksum mismatch") {
    TestSubject t("abc");
    Segment seg = makeSegment(3);
    seg.remote.checksum = "md5:00000000000000000000000000000000";

    Transfer done = t.finish(t.manager->start(seg));
    CHECK(done.state == TransferState::Failed);
    CHECK(done.error == TransferError::Integrity);
    CHECK_FALSE(t.manager->storage().isComplete(seg));
  }
  SECTION("Matching checksum completes") {
    TestSubject t("abc");
    Segment seg = makeSegment(3);
    seg.remote.checksum = "MD5:900150983CD24FB0D6963F7D28E17F72";

    Transfer done = t.finish(t.manager->start(seg));
    CHECK(done.state == TransferState::Completed);
    CHECK(t.manager->storage().isComplete(seg));
  }
}

TEST_CASE("Segments that cannot be downloaded are rejected", "[download]") {
  TestSubject t("abc");
  Segment seg = makeSegment(3);

  SECTION("Unavailable") { seg.availability = Availability::Unavailable; }
  SECTION("Unsupported method") { seg.downloadMethod = "aad"; }
  SECTION("No URL") { seg.remote.url.clear(); }
  SECTION("Token required") {
    seg.downloadMethod = "nsidc";
    seg.remote.credential = CredentialClass::BearerToken;
  }
  SECTION("Path outside the root") { seg.relativePath = "../escape.nc"; }

  const auto id = t.manager->start(seg);
  Transfer done;
  REQUIRE(t.manager->transfer(id, done));
  CHECK(done.state == TransferState::Failed);
  CHECK(done.error == TransferError::Rejected);
  CHECK_FALSE(done.reason.empty());
  CHECK(t.transport->requests().empty());
}

TEST_CASE("Bearer token is sent for NSIDC segments", "[download]") {
  TestSubject t("abc", "secret-token");
  Segment seg = makeSegment(3);
  seg.downloadMethod = "nsidc";
  seg.remote.credential = CredentialClass::BearerToken;

  Transfer done = t.finish(t.manager->start(seg));
  CHECK(done.state == TransferState::Completed);
  REQUIRE(t.transport->requests().size() == 1);
  CHECK(t.transport->requests()[0].bearerToken == "secret-token");
}

TEST_CASE("Already-downloaded segments complete at once", "[download]") {
  TestSubject t("abc");
  Segment seg = makeSegment(3);
  test_support::writeFile(t.manager->storage().finalPath(seg), "abc");

  CHECK(t.manager->availability(seg) == Availability::AvailableLocal);
  const auto id = t.manager->start(seg);
  Transfer done;
  REQUIRE(t.manager->transfer(id, done));
  CHECK(done.state == TransferState::Completed);
  CHECK(done.bytesReceived == 3);
  CHECK(t.transport->requests().empty());
}

TEST_CASE("Manager requires a transport", "[download]") {
  DownloadConfig cfg;
  CHECK_THROWS_AS(DownloadManager(cfg, nullptr), std::invalid_argument);
}

TEST_CASE("curl transport reads file URLs", "[download][curl]") {
  test_support::TempDir dir;
  const std::string body = makeBody(70000);
  test_support::writeFile(dir / "source.nc", body);

  NetworkManager net;
  TransportRequest req;
  req.url = "file://" + (dir / "source.nc").string();

  std::string got;
  bool started = false;
  TransportCallbacks cb;
  cb.onStart = [&](long, bool resumed, std::uint64_t) {
    started = true;
    CHECK_FALSE(resumed);
    return true;
  };
  cb.onData = [&](const char *data, std::size_t len) {
    got.append(data, len);
    return true;
  };
  cb.keepGoing = [] { return true; };

  SECTION("Whole file") {
    TransportResult res = net.fetch(req, cb);
    CHECK(res.ok);
    CHECK(started);
    CHECK(got == body);
  }
  SECTION("Callbacks can abort") {
    cb.onData = [](const char *, std::size_t) { return false; };
    TransportResult res = net.fetch(req, cb);
    CHECK_FALSE(res.ok);
    CHECK(res.aborted);
  }
  SECTION("Missing file fails") {
    req.url = "file://" + (dir / "missing.nc").string();
    TransportResult res = net.fetch(req, cb);
    CHECK_FALSE(res.ok);
    CHECK_FALSE(res.aborted);
    CHECK_FALSE(res.error.empty());
  }
}

TEST_CASE("curl transport resumes over HTTP", "[download][curl]") {
  test_support::TempDir dir;
  const std::string body = makeBody(100000);
  Segment seg = makeSegment(body.size());

  DownloadConfig cfg;
  cfg.rootDir = dir.path();

  SECTION("Server ignores the range") {
    test_support::HttpServer server(body, false);
    seg.remote.url = server.url("F16T01a_001.nc");
    DownloadManager manager(cfg, std::make_shared<NetworkManager>());
    test_support::writeFile(manager.storage().partialPath(seg),
                            std::string(40000, 'Z'));

    const auto id = manager.start(seg);
    REQUIRE(manager.waitFor(id, 10s));
    Transfer done;
    REQUIRE(manager.transfer(id, done));
    CHECK(done.state == TransferState::Completed);
    CHECK(test_support::readFile(manager.storage().finalPath(seg)) == body);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].find("Range: bytes=40000-") != std::string::npos);
  }
  SECTION("Server honours the range") {
    test_support::HttpServer server(body, true);
    seg.remote.url = server.url("F16T01a_001.nc");
    DownloadManager manager(cfg, std::make_shared<NetworkManager>());
    test_support::writeFile(manager.storage().partialPath(seg),
                            body.substr(0, 40000));

    const auto id = manager.start(seg);
    REQUIRE(manager.waitFor(id, 10s));
    Transfer done;
    REQUIRE(manager.transfer(id, done));
    CHECK(done.state == TransferState::Completed);
    CHECK(done.bytesTotal == body.size());
    CHECK(test_support::readFile(manager.storage().finalPath(seg)) == body);
    REQUIRE(server.requests().size() == 1);
  }
}

} // namespace download_manager
