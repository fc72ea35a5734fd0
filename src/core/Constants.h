#pragma once

#include <cstddef>
#include <cstdint>

// Project-wide constants for QIceRadar-Next

#define QICERADAR_VERSION "0.4.0"

namespace QIceRadar {

// Initial viewer window dimensions
static constexpr int INITIAL_WIDTH = 1200;
static constexpr int INITIAL_HEIGHT = 600;

// Frame rate control
static constexpr int FRAME_DELAY_MS = 16;

// Segment locator defaults
static constexpr std::size_t DEFAULT_MAX_CANDIDATES = 5;
static constexpr double DEFAULT_LOCATE_CUTOFF_KM = 500.0;

// Viewer defaults. Consecutive prev/next windows share this fraction of
// their width.
static constexpr double DEFAULT_STEP_OVERLAP = 0.2;
static constexpr double MIN_STEP_OVERLAP = 0.05;
static constexpr double MAX_STEP_OVERLAP = 0.5;
static constexpr double DEFAULT_ZOOM_OUT_FACTOR = 2.0;

// Radargrams smaller than this are read into memory in one go.
static constexpr std::size_t DEFAULT_SMALL_FILE_BYTES = 32u * 1024u * 1024u;

// Downloads
static constexpr int DEFAULT_MAX_CONCURRENT_TRANSFERS = 2;
static constexpr int DEFAULT_CONNECT_TIMEOUT_S = 10;
// Abort when throughput stays below LOW_SPEED_BYTES for LOW_SPEED_TIME_S
static constexpr long DEFAULT_LOW_SPEED_BYTES = 1;
static constexpr int DEFAULT_LOW_SPEED_TIME_S = 60;

static constexpr const char *PARTIAL_SUFFIX = ".partial";

// Mean Earth radius used by the haversine distance (metres)
static constexpr double EARTH_RADIUS_M = 6371008.8;

} // namespace QIceRadar
