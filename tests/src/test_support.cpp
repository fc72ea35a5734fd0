#include "test_support.h"

#include <netcdf.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace test_support {

namespace {

void check(int status, const std::string &what) {
  if (status != NC_NOERR)
    throw std::runtime_error(what + ": " + nc_strerror(status));
}

void putAxis(int ncid, int varid, const std::vector<double> &values) {
  check(nc_put_var_double(ncid, varid, values.data()), "put axis");
}

} // namespace

TempDir::TempDir() {
  static std::atomic<int> counter{0};
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  path_ = std::filesystem::temp_directory_path() /
          ("qiceradar-test-" + std::to_string(stamp) + "-" +
           std::to_string(counter++));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void writeFile(const std::filesystem::path &path, const std::string &data) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out)
    throw std::runtime_error("cannot write " + path.string());
}

std::string readFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

double traceLatitude(std::size_t t) { return 75.0 + t * 0.001; }
double traceLongitude(std::size_t t) { return 120.0 + t * 0.002; }
double sampleFastTime(std::size_t s) { return 0.05 * s; }
double traceUtc(std::size_t i) { return 1.5e9 + i; }

void writeRadarFile(const std::filesystem::path &path,
                    const RadarFileLayout &layout) {
  int ncid = -1;
  check(nc_create(path.c_str(), NC_CLOBBER, &ncid), "create " + path.string());

  const std::size_t geoLen =
      layout.agapPulseTraces     ? layout.agapPulseTraces
      : layout.geolocationLength ? layout.geolocationLength
                                 : layout.traces;

  int traceDim, sampleDim, geoDim;
  check(nc_def_dim(ncid, "traces", layout.traces, &traceDim), "def traces");
  check(nc_def_dim(ncid, "samples", layout.samples, &sampleDim), "def samples");
  if (geoLen != layout.traces)
    check(nc_def_dim(ncid, "geo", geoLen, &geoDim), "def geo");
  else
    geoDim = traceDim;

  int dataDims[2];
  if (layout.samplesMajor) {
    dataDims[0] = sampleDim;
    dataDims[1] = traceDim;
  } else {
    dataDims[0] = traceDim;
    dataDims[1] = sampleDim;
  }

  int dataVar, latVar, lonVar, timeVar, utcVar = -1;
  int tracesPulseVar = -1, priPulseVar = -1, priChirpVar = -1;
  check(nc_def_var(ncid, layout.dataVar.c_str(),
                   layout.dataAsText ? NC_CHAR : NC_FLOAT, 2, dataDims,
                   &dataVar),
        "def " + layout.dataVar);
  int otherVar = -1;
  if (!layout.otherDataVar.empty())
    check(nc_def_var(ncid, layout.otherDataVar.c_str(), NC_FLOAT, 2, dataDims,
                     &otherVar),
          "def " + layout.otherDataVar);
  check(nc_def_var(ncid, layout.latName.c_str(), NC_DOUBLE, 1, &geoDim,
                   &latVar),
        "def lat");
  check(nc_def_var(ncid, layout.lonName.c_str(), NC_DOUBLE, 1, &geoDim,
                   &lonVar),
        "def lon");
  check(nc_def_var(ncid, layout.fastTimeName.c_str(), NC_DOUBLE, 1, &sampleDim,
                   &timeVar),
        "def fast time");
  if (!layout.utcName.empty())
    check(nc_def_var(ncid, layout.utcName.c_str(), NC_DOUBLE, 1, &geoDim,
                     &utcVar),
          "def utc");
  if (layout.agapPulseTraces) {
    check(nc_def_var(ncid, "traces_pulse", NC_DOUBLE, 1, &geoDim,
                     &tracesPulseVar),
          "def traces_pulse");
    check(nc_def_var(ncid, "PriNumber_pulse", NC_DOUBLE, 1, &geoDim,
                     &priPulseVar),
          "def PriNumber_pulse");
    check(nc_def_var(ncid, "PriNumber_chirp", NC_DOUBLE, 1, &traceDim,
                     &priChirpVar),
          "def PriNumber_chirp");
  }
  if (!layout.campaign.empty())
    check(nc_put_att_text(ncid, NC_GLOBAL, "campaign", layout.campaign.size(),
                          layout.campaign.c_str()),
          "put campaign");
  check(nc_enddef(ncid), "enddef");

  const std::size_t cells = layout.traces * layout.samples;
  if (layout.dataAsText) {
    std::string text(cells, 'x');
    check(nc_put_var_text(ncid, dataVar, text.data()), "put data");
  } else {
    std::vector<float> data(cells);
    for (std::size_t t = 0; t < layout.traces; ++t) {
      for (std::size_t s = 0; s < layout.samples; ++s) {
        const std::size_t row =
            layout.samplesReversed ? layout.samples - 1 - s : s;
        const std::size_t idx = layout.samplesMajor
                                    ? row * layout.traces + t
                                    : t * layout.samples + s;
        data[idx] = layout.value(t, s);
      }
    }
    check(nc_put_var_float(ncid, dataVar, data.data()), "put data");
  }
  if (otherVar >= 0) {
    std::vector<float> other(cells, 7.0f);
    check(nc_put_var_float(ncid, otherVar, other.data()), "put other data");
  }

  std::vector<double> lat(geoLen), lon(geoLen), utc(geoLen),
      fast(layout.samples);
  for (std::size_t i = 0; i < geoLen; ++i) {
    lat[i] = traceLatitude(i);
    lon[i] = traceLongitude(i);
    utc[i] = traceUtc(i);
  }
  for (std::size_t s = 0; s < layout.samples; ++s)
    fast[s] = layout.fastTime(s);

  putAxis(ncid, latVar, lat);
  putAxis(ncid, lonVar, lon);
  putAxis(ncid, timeVar, fast);
  if (utcVar >= 0)
    putAxis(ncid, utcVar, utc);

  if (layout.agapPulseTraces) {
    std::vector<double> tracesPulse(geoLen), priPulse(geoLen),
        priChirp(layout.traces);
    for (std::size_t i = 0; i < geoLen; ++i) {
      tracesPulse[i] = static_cast<double>(i);
      priPulse[i] = 10.0 * i;
    }
    for (std::size_t t = 0; t < layout.traces; ++t)
      priChirp[t] = 12.0 * t + 5.0;
    putAxis(ncid, tracesPulseVar, tracesPulse);
    putAxis(ncid, priPulseVar, priPulse);
    putAxis(ncid, priChirpVar, priChirp);
  }

  check(nc_close(ncid), "close " + path.string());
}

HttpServer::HttpServer(std::string body, bool honourRange)
    : body_(std::move(body)), honourRange_(honourRange) {
  listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listenFd_ < 0)
    throw std::runtime_error(std::string("socket: ") + std::strerror(errno));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(listenFd_, 4) != 0 ||
      ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    const std::string err = std::strerror(errno);
    ::close(listenFd_);
    throw std::runtime_error("cannot listen on loopback: " + err);
  }
  port_ = ntohs(addr.sin_port);
  thread_ = std::thread(&HttpServer::serve, this);
}

HttpServer::~HttpServer() {
  // Wakes the blocked accept()
  ::shutdown(listenFd_, SHUT_RDWR);
  ::close(listenFd_);
  if (thread_.joinable())
    thread_.join();
}

std::string HttpServer::url(const std::string &path) const {
  return "http://127.0.0.1:" + std::to_string(port_) + "/" + path;
}

std::vector<std::string> HttpServer::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

void HttpServer::serve() {
  while (true) {
    const int fd = ::accept(listenFd_, nullptr, nullptr);
    if (fd < 0) {
      if (errno == EINTR)
        continue;
      return;
    }
    answer(fd);
    ::close(fd);
  }
}

void HttpServer::answer(int fd) {
  std::string head;
  char buf[1024];
  while (head.find("\r\n\r\n") == std::string::npos) {
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0)
      return;
    head.append(buf, static_cast<std::size_t>(n));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(head);
  }

  std::size_t from = 0;
  const std::string key = "Range: bytes=";
  const auto at = head.find(key);
  if (honourRange_ && at != std::string::npos)
    from = std::stoull(head.substr(at + key.size()));

  std::string reply;
  if (from > 0 && from < body_.size()) {
    reply = "HTTP/1.1 206 Partial Content\r\n"
            "Content-Range: bytes " + std::to_string(from) + "-" +
            std::to_string(body_.size() - 1) + "/" +
            std::to_string(body_.size()) + "\r\n";
  } else {
    from = 0;
    reply = "HTTP/1.1 200 OK\r\n";
  }
  reply += "Content-Length: " + std::to_string(body_.size() - from) +
           "\r\nConnection: close\r\n\r\n";
  reply.append(body_, from, std::string::npos);

  std::size_t sent = 0;
  while (sent < reply.size()) {
    const ssize_t n = ::send(fd, reply.data() + sent, reply.size() - sent,
                             MSG_NOSIGNAL);
    if (n <= 0)
      return;
    sent += static_cast<std::size_t>(n);
  }
}

} // namespace test_support
