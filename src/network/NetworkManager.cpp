#include "NetworkManager.h"
#include "../core/Logger.h"

#include <curl/curl.h>

namespace {

struct FetchState {
  CURL *curl = nullptr;
  const TransportRequest *req = nullptr;
  const TransportCallbacks *cb = nullptr;
  bool started = false;
  bool aborted = false;
  long status = 0;
};

bool startOnce(FetchState &st) {
  if (st.started)
    return true;
  st.started = true;

  curl_easy_getinfo(st.curl, CURLINFO_RESPONSE_CODE, &st.status);
  curl_off_t length = -1;
  curl_easy_getinfo(st.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

  // file:// reports no status but honours CURLOPT_RANGE
  const bool resumed = st.req->resumeFrom > 0 &&
                       (st.status == 206 || st.status == 0);
  std::uint64_t total = 0;
  if (length >= 0)
    total = static_cast<std::uint64_t>(length) +
            (resumed ? st.req->resumeFrom : 0);

  if (st.cb->onStart && !st.cb->onStart(st.status, resumed, total)) {
    st.aborted = true;
    return false;
  }
  return true;
}

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *st = static_cast<FetchState *>(userdata);
  const size_t len = size * nmemb;
  if (!startOnce(*st))
    return 0;
  if ((st->cb->keepGoing && !st->cb->keepGoing()) ||
      (st->cb->onData && !st->cb->onData(ptr, len))) {
    st->aborted = true;
    return 0;
  }
  return len;
}

int xferInfoCallback(void *userdata, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  auto *st = static_cast<FetchState *>(userdata);
  if (st->cb->keepGoing && !st->cb->keepGoing()) {
    st->aborted = true;
    return 1;
  }
  return 0;
}

} // namespace

NetworkManager::NetworkManager(std::string userAgent)
    : userAgent_(std::move(userAgent)) {}

TransportResult NetworkManager::fetch(const TransportRequest &req,
                                      const TransportCallbacks &cb) {
  TransportResult result;

  CURL *curl = curl_easy_init();
  if (!curl) {
    result.error = "curl_easy_init failed";
    LOG_E("NetworkManager", "{}", result.error);
    return result;
  }

  FetchState st;
  st.curl = curl;
  st.req = &req;
  st.cb = &cb;

  struct curl_slist *headers = nullptr;
  if (!req.bearerToken.empty()) {
    std::string auth = "Authorization: Bearer " + req.bearerToken;
    headers = curl_slist_append(headers, auth.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &st);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, req.connectTimeoutS);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, req.lowSpeedBytes);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, req.lowSpeedTimeS);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
  if (headers)
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  // Not CURLOPT_RESUME_FROM_LARGE: it turns a 200 reply into
  // CURLE_RANGE_ERROR instead of handing us the whole body.
  const std::string range =
      req.resumeFrom > 0 ? std::to_string(req.resumeFrom) + "-" : "";
  if (!range.empty())
    curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());

  CURLcode res = curl_easy_perform(curl);

  // Empty bodies never reach the write callback
  if (res == CURLE_OK && !st.started)
    startOnce(st);
  if (st.status == 0)
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &st.status);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  result.status = st.status;
  result.aborted = st.aborted;
  if (st.aborted) {
    result.error = "aborted";
  } else if (res != CURLE_OK) {
    result.error = curl_easy_strerror(res);
    if (st.status >= 400)
      result.error += " (HTTP " + std::to_string(st.status) + ")";
    LOG_W("NetworkManager", "fetch failed for {}: {}", req.url, result.error);
  } else {
    result.ok = true;
  }
  return result;
}
