#pragma once

#include "Transport.h"

#include <string>

// libcurl implementation of Transport. Each fetch() uses its own easy
// handle, so one instance may serve several worker threads at once.
// curl_global_init() must have been called before the first fetch().
class NetworkManager : public Transport {
public:
  explicit NetworkManager(std::string userAgent = "QIceRadar-Next");

  TransportResult fetch(const TransportRequest &req,
                        const TransportCallbacks &cb) override;

private:
  std::string userAgent_;
};
