#include "core/ConfigManager.h"
#include "core/Constants.h"
#include "core/GeometryIndex.h"
#include "core/Logger.h"
#include "core/RadargramStore.h"
#include "core/SegmentLocator.h"
#include "core/StringUtils.h"
#include "core/WorkerService.h"
#include "network/NetworkManager.h"
#include "services/DownloadManager.h"
#include "ui/RadargramWidget.h"

#include <SDL.h>
#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted = true; }

struct Options {
  std::string configDir;
  std::string logLevel;
  std::string indexPath;
  bool locate = false;
  double lat = 0.0;
  double lon = 0.0;
  std::string downloadId;
  std::string view;
  bool software = false;
};

void printUsage() {
  std::printf(
      "Usage: qiceradar-next [options]\n"
      "  --config DIR        configuration directory\n"
      "  --log-level LEVEL   trace, debug, info, warn or error\n"
      "  --index PATH        JSON groundtrack catalog\n"
      "  --locate LAT LON    list the transects nearest to a point\n"
      "  --download ID       download one transect\n"
      "  --view PATH|ID      open a radargram file or downloaded transect\n"
      "  -s, --software      use the software renderer\n");
}

// Returns false on a malformed command line.
bool parseArgs(int argc, char *argv[], Options &opt) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opt.configDir = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      opt.logLevel = argv[++i];
    } else if (arg == "--index" && i + 1 < argc) {
      opt.indexPath = argv[++i];
    } else if (arg == "--locate" && i + 2 < argc) {
      opt.locate = true;
      opt.lat = StringUtils::safe_stod(argv[++i]);
      opt.lon = StringUtils::safe_stod(argv[++i]);
    } else if (arg == "--download" && i + 1 < argc) {
      opt.downloadId = argv[++i];
    } else if (arg == "--view" && i + 1 < argc) {
      opt.view = argv[++i];
    } else if (arg == "-s" || arg == "--software") {
      opt.software = true;
    } else {
      return false;
    }
  }
  return true;
}

DownloadConfig downloadConfigFrom(const AppConfig &cfg) {
  DownloadConfig dc;
  dc.rootDir = cfg.rootDir;
  dc.nsidcToken = cfg.nsidcToken;
  dc.maxConcurrent = static_cast<std::size_t>(cfg.maxConcurrentTransfers);
  dc.connectTimeoutS = cfg.connectTimeoutS;
  dc.lowSpeedBytes = cfg.lowSpeedBytes;
  dc.lowSpeedTimeS = cfg.lowSpeedTimeS;
  return dc;
}

int runLocate(const Options &opt, const AppConfig &cfg,
              const JsonGeometryIndex &index, const DownloadManager &dl) {
  SegmentLocator locator(index, cfg.cutoffKm);
  auto ids = index.allIds();
  std::set<std::string> visible(ids.begin(), ids.end());
  auto candidates = locator.locate({opt.lat, opt.lon}, visible,
                                   static_cast<std::size_t>(cfg.maxCandidates));
  if (candidates.empty()) {
    std::printf("No transects within %.0f km of (%.4f, %.4f)\n", cfg.cutoffKm,
                opt.lat, opt.lon);
    return EXIT_SUCCESS;
  }
  for (const auto &c : candidates) {
    std::printf("%-40s %8.2f km  %-16s  nearest (%.5f, %.5f)  %s/%s\n",
                c.segment.id.c_str(), c.distanceM / 1000.0,
                availabilityName(dl.availability(c.segment)), c.nearest.lat,
                c.nearest.lon, c.segment.institution.c_str(),
                c.segment.campaign.c_str());
  }
  return EXIT_SUCCESS;
}

int runDownload(const Options &opt, const JsonGeometryIndex &index,
                DownloadManager &dl) {
  Segment seg;
  if (!index.find(opt.downloadId, seg)) {
    std::fprintf(stderr, "Unknown transect %s\n", opt.downloadId.c_str());
    return EXIT_FAILURE;
  }

  int token = dl.subscribe([](const Transfer &t) {
    if (t.bytesTotal > 0)
      std::fprintf(stderr, "\r%s: %s / %s   ", t.segmentId.c_str(),
                   StringUtils::formatBytes(t.bytesReceived).c_str(),
                   StringUtils::formatBytes(t.bytesTotal).c_str());
    else
      std::fprintf(stderr, "\r%s: %s   ", t.segmentId.c_str(),
                   StringUtils::formatBytes(t.bytesReceived).c_str());
  });

  std::uint64_t id = dl.start(seg);
  bool cancelled = false;
  while (!dl.waitFor(id, std::chrono::milliseconds(200))) {
    if (g_interrupted && !cancelled) {
      cancelled = dl.cancel(id);
    }
  }
  dl.unsubscribe(token);
  std::fprintf(stderr, "\n");

  Transfer t;
  if (!dl.transfer(id, t))
    return EXIT_FAILURE;
  switch (t.state) {
  case TransferState::Completed:
    std::printf("%s\n", dl.storage().finalPath(seg).string().c_str());
    return EXIT_SUCCESS;
  case TransferState::PausedByCancel:
    std::printf("Download of %s cancelled\n", seg.id.c_str());
    return EXIT_FAILURE;
  default:
    std::fprintf(stderr, "Download of %s failed (%s): %s\n", seg.id.c_str(),
                 transferErrorName(t.error), t.reason.c_str());
    return EXIT_FAILURE;
  }
}

// Resolves --view to a local file and, for a catalog transect, its data
// format. Prints the reason and returns an empty path if there is nothing
// local to open.
std::filesystem::path resolveView(const std::string &view,
                                  const JsonGeometryIndex &index,
                                  const DownloadManager &dl,
                                  std::string &dataFormat) {
  dataFormat.clear();
  std::error_code ec;
  if (std::filesystem::is_regular_file(view, ec))
    return view;

  Segment seg;
  if (!index.find(view, seg)) {
    std::fprintf(stderr, "%s is neither a file nor a known transect\n",
                 view.c_str());
    return {};
  }
  Availability a = dl.availability(seg);
  if (a != Availability::AvailableLocal) {
    std::fprintf(stderr,
                 "%s is %s; download it first with --download %s\n",
                 seg.id.c_str(), availabilityName(a), seg.id.c_str());
    return {};
  }
  dataFormat = seg.dataFormat;
  return dl.storage().finalPath(seg);
}

int runViewer(const Options &opt, const AppConfig &cfg,
              std::shared_ptr<const RadargramStore> store) {
  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    LOG_ERROR("SDL_Init failed: {}", SDL_GetError());
    return EXIT_FAILURE;
  }
  if (opt.software)
    SDL_SetHint(SDL_HINT_RENDER_DRIVER, "software");

  std::string title = "QIceRadar-Next - " + store->path().filename().string();
  SDL_Window *window = SDL_CreateWindow(
      title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      QIceRadar::INITIAL_WIDTH, QIceRadar::INITIAL_HEIGHT,
      SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
  if (!window) {
    LOG_ERROR("SDL_CreateWindow failed: {}", SDL_GetError());
    SDL_Quit();
    return EXIT_FAILURE;
  }
  SDL_Renderer *renderer = SDL_CreateRenderer(
      window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
  if (!renderer) {
    LOG_WARN("Accelerated renderer unavailable ({}), using software",
             SDL_GetError());
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
  }
  if (!renderer) {
    LOG_ERROR("SDL_CreateRenderer failed: {}", SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    return EXIT_FAILURE;
  }

  {
    WorkerService readers(1, "Reader");
    RadargramWidget radargram(0, 0, QIceRadar::INITIAL_WIDTH,
                              QIceRadar::INITIAL_HEIGHT, readers, store,
                              cfg.stepOverlap, cfg.colormap);
    radargram.setStatusCallback([window, title](const std::string &status) {
      SDL_SetWindowTitle(window, (title + "   " + status).c_str());
    });
    radargram.setCursorListener([](const TraceGeolocation &geo) {
      LOG_T("Main", "cursor ({:.5f}, {:.5f})", geo.lat, geo.lon);
    });
    radargram.setTrackListener([](const std::vector<LatLon> &track) {
      LOG_D("Main", "visible track has {} points", track.size());
    });

    bool running = true;
    while (running && !g_interrupted) {
      SDL_Event event;
      while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_QUIT:
          running = false;
          break;
        case SDL_WINDOWEVENT:
          if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
            int w = 0, h = 0;
            SDL_GetRendererOutputSize(renderer, &w, &h);
            radargram.onResize(0, 0, w, h);
          }
          break;
        case SDL_MOUSEBUTTONDOWN:
          radargram.onMouseDown(event.button.x, event.button.y,
                                event.button.button);
          break;
        case SDL_MOUSEBUTTONUP:
          radargram.onMouseUp(event.button.x, event.button.y,
                              event.button.button);
          break;
        case SDL_MOUSEMOTION:
          radargram.onMouseMove(event.motion.x, event.motion.y);
          break;
        case SDL_MOUSEWHEEL:
          radargram.onMouseWheel(event.wheel.y);
          break;
        case SDL_KEYDOWN:
          if (event.key.keysym.sym == SDLK_q ||
              event.key.keysym.sym == SDLK_ESCAPE)
            running = false;
          else
            radargram.onKeyDown(event.key.keysym.sym, event.key.keysym.mod);
          break;
        default:
          break;
        }
      }

      radargram.update();
      SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
      SDL_RenderClear(renderer);
      radargram.render(renderer);
      SDL_RenderPresent(renderer);
      SDL_Delay(QIceRadar::FRAME_DELAY_MS);
    }
    readers.stop();
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
  SDL_SetMainReady();

  Options opt;
  if (!parseArgs(argc, argv, opt)) {
    printUsage();
    return EXIT_FAILURE;
  }

  curl_global_init(CURL_GLOBAL_ALL);
  std::signal(SIGINT, onSignal);

  // On Linux: ~/.local/share/QIceRadar/QIceRadar-Next/
  std::filesystem::path configDir = opt.configDir;
  if (configDir.empty()) {
    char *prefPath = SDL_GetPrefPath("QIceRadar", "QIceRadar-Next");
    if (prefPath) {
      configDir = prefPath;
      SDL_free(prefPath);
    } else {
      std::fprintf(stderr, "SDL_GetPrefPath failed: %s\n", SDL_GetError());
    }
  }

  ConfigManager cfgMgr;
  AppConfig cfg;
  bool haveDir = cfgMgr.init(configDir);
  Log::init(haveDir ? cfgMgr.configDir().string() : "");

  if (!haveDir) {
    LOG_WARN("Could not resolve config directory, using defaults");
  } else if (!cfgMgr.load(cfg)) {
    LOG_WARN("No usable config in {}; set storage.root_dir to download",
             cfgMgr.configPath().string());
    if (!std::filesystem::exists(cfgMgr.configPath()) && !cfgMgr.save(cfg))
      LOG_WARN("Could not write a default config");
  }

  Log::setLevel(Log::levelFromString(opt.logLevel.empty() ? cfg.logLevel
                                                          : opt.logLevel));
  LOG_INFO("Starting QIceRadar-Next v{}...", QICERADAR_VERSION);

  JsonGeometryIndex index;
  const std::string indexPath =
      opt.indexPath.empty() ? cfg.indexPath : opt.indexPath;
  if (!indexPath.empty() && !index.loadFile(indexPath))
    LOG_ERROR("Could not load index {}", indexPath);

  int rc = EXIT_SUCCESS;
  {
    DownloadManager dl(downloadConfigFrom(cfg),
                       std::make_shared<NetworkManager>());

    if (opt.locate) {
      rc = runLocate(opt, cfg, index, dl);
    } else if (!opt.downloadId.empty()) {
      rc = runDownload(opt, index, dl);
    } else if (!opt.view.empty()) {
      std::string dataFormat;
      std::filesystem::path path = resolveView(opt.view, index, dl, dataFormat);
      if (path.empty()) {
        rc = EXIT_FAILURE;
      } else {
        try {
          auto store = RadargramStore::open(path, cfg.smallFileBytes, dataFormat);
          rc = runViewer(opt, cfg, store);
        } catch (const FormatError &e) {
          std::fprintf(stderr, "Cannot open %s: %s\n", path.string().c_str(),
                       e.what());
          rc = EXIT_FAILURE;
        }
      }
    } else {
      printUsage();
    }
  }

  curl_global_cleanup();
  return rc;
}
