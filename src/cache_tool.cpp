// assetcdn-cache: query and prefetch tool for the local bundle cache.
//
// Opens the bundle cache manifest under --cache-dir. Prefetch drives the
// download orchestrator exactly as an application would.
//
// Usage: assetcdn-cache --cache-dir <dir> [options] <subcommand> [args]
//
// Subcommands:
//   stat                         Entry count and cached bytes
//   status <key>                 Cached flag, progress and size for one key
//   prefetch <key...>            Download keys into the cache
//   clear [key]                  Remove one cached bundle, or all of them

#include "assetcdn/bundle_cache.hpp"
#include "assetcdn/download_orchestrator.hpp"
#include "assetcdn/handle_repository.hpp"
#include "assetcdn/log.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

void print_usage() {
    fprintf(stderr,
        "Usage: assetcdn-cache --cache-dir <dir> [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  stat                          Entry count and cached bytes\n"
        "  status <key>                  Cached flag, progress and size for one key\n"
        "  prefetch <key...>             Download keys into the cache\n"
        "  clear [key]                   Remove one cached bundle, or all of them\n"
        "\n"
        "Options:\n"
        "  --cache-dir <dir>             Bundle cache directory\n"
        "                                (default: $ASSETCDN_CACHE_DIR)\n"
        "  --catalog <json>              Bundle catalog {\"bundles\":[{key,path,size}]}\n"
        "  --cdn-url <url>               CDN base URL bundles are fetched from\n"
        "  --priority <p>                low, normal, high, critical (default: normal)\n"
        "  --max-cache-mb <N>            Cache size limit in MB (default: 4096)\n"
        "  --verbose                     Verbose output\n"
        "  --help                        Show this help\n"
    );
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace assetcdn;

    std::string cache_dir;
    std::string catalog_path;
    std::string cdn_url;
    std::string subcommand;
    std::vector<std::string> keys;
    DownloadPriority priority = DownloadPriority::Normal;
    uint64_t max_cache_bytes = constants::DEFAULT_MAX_CACHE_BYTES;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--cache-dir") {
            if (++i >= argc) { fprintf(stderr, "--cache-dir requires argument\n"); return 1; }
            cache_dir = argv[i];
        } else if (arg == "--catalog") {
            if (++i >= argc) { fprintf(stderr, "--catalog requires argument\n"); return 1; }
            catalog_path = argv[i];
        } else if (arg == "--cdn-url") {
            if (++i >= argc) { fprintf(stderr, "--cdn-url requires argument\n"); return 1; }
            cdn_url = argv[i];
        } else if (arg == "--priority") {
            if (++i >= argc) { fprintf(stderr, "--priority requires argument\n"); return 1; }
            if (!parse_priority(argv[i], priority)) {
                fprintf(stderr, "Unknown priority: %s\n", argv[i]);
                return 1;
            }
        } else if (arg == "--max-cache-mb") {
            if (++i >= argc) { fprintf(stderr, "--max-cache-mb requires argument\n"); return 1; }
            char* end = nullptr;
            uint64_t mb = strtoull(argv[i], &end, 10);
            if (!end || *end != '\0' || mb == 0) {
                fprintf(stderr, "Invalid --max-cache-mb: %s\n", argv[i]);
                return 1;
            }
            max_cache_bytes = mb * 1024 * 1024;
        } else if (arg == "--verbose") {
            set_verbose(true);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (arg[0] != '-' && (subcommand == "status" || subcommand == "prefetch" ||
                                     subcommand == "clear")) {
            keys.push_back(arg);
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }

    if (cache_dir.empty()) {
        const char* env = getenv("ASSETCDN_CACHE_DIR");
        if (!env) {
            fprintf(stderr, "--cache-dir is required (or set ASSETCDN_CACHE_DIR)\n");
            return 1;
        }
        cache_dir = env;
    }

    BundleCacheConfig cache_config;
    cache_config.cache_dir = cache_dir;
    cache_config.max_cache_bytes = max_cache_bytes;

    std::unique_ptr<BundleSource> source;
    if (!cdn_url.empty()) source = make_http_source(cdn_url);

    BundleCache cache(cache_config, std::move(source));
    auto err = cache.start();
    if (!err.empty()) {
        fprintf(stderr, "Cannot open bundle cache: %s\n", err.c_str());
        return 1;
    }
    if (!catalog_path.empty()) {
        err = cache.load_catalog(catalog_path);
        if (!err.empty()) {
            fprintf(stderr, "Cannot load catalog: %s\n", err.c_str());
            return 1;
        }
    }

    // --- Subcommands ---

    if (subcommand == "stat") {
        auto stats = cache.get_stats();
        printf("entries:     %" PRIu64 "\n", stats.entries);
        printf("cache_bytes: %" PRIu64 " (%.2f MB)\n", stats.cache_bytes,
               static_cast<double>(stats.cache_bytes) / (1024.0 * 1024));
        printf("max_bytes:   %" PRIu64 "\n", max_cache_bytes);
        printf("catalog:     %zu\n", cache.catalog_size());
        return 0;
    }

    if (subcommand == "status") {
        if (keys.size() != 1) {
            fprintf(stderr, "Usage: assetcdn-cache status <key>\n");
            return 1;
        }
        HandleRepository repository([&cache](const ResourceHandle& h) { cache.release(h); });
        DownloadOrchestrator orchestrator(cache, repository);
        auto info = orchestrator.get_asset_info(keys[0]);
        printf("key:       %s\n", keys[0].c_str());
        printf("known:     %s\n", info.exists ? "yes" : "no");
        printf("cached:    %s\n", cache.is_cached(keys[0]) ? "yes" : "no");
        printf("progress:  %.2f\n", info.progress);
        printf("to_fetch:  %" PRIu64 "\n", info.size_bytes);
        orchestrator.stop();
        return info.exists ? 0 : 1;
    }

    if (subcommand == "prefetch") {
        if (keys.empty()) {
            fprintf(stderr, "Usage: assetcdn-cache prefetch <key...>\n");
            return 1;
        }

        struct sigaction sa;
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);

        HandleRepository repository([&cache](const ResourceHandle& h) { cache.release(h); });
        DownloadOrchestrator orchestrator(cache, repository);

        // Polls the signal flag while prefetch runs on this thread.
        CancellationSource cancel;
        std::atomic<bool> done{false};
        std::thread watcher([&] {
            while (!done.load()) {
                if (g_interrupted) {
                    cancel.cancel();
                    orchestrator.cancel_all_downloads();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        std::mutex print_mutex;
        bool ok = orchestrator.pre_download_assets(
            keys, priority,
            [&print_mutex](const std::string& key, double progress) {
                std::lock_guard<std::mutex> lock(print_mutex);
                fprintf(stderr, "\r%-48s %3d%%", key.c_str(), static_cast<int>(progress * 100));
                if (progress >= 1.0) fprintf(stderr, "\n");
            },
            cancel.token());

        done.store(true);
        watcher.join();

        auto stats = orchestrator.get_stats();
        orchestrator.stop();
        printf("requested: %zu, fetched: %" PRIu64 ", cached: %" PRIu64 ", failed: %" PRIu64
               ", cancelled: %" PRIu64 "\n",
               keys.size(), stats.fetches_succeeded, stats.cache_hits, stats.fetches_failed,
               stats.fetches_cancelled);
        return ok ? 0 : 1;
    }

    if (subcommand == "clear") {
        if (keys.size() > 1) {
            fprintf(stderr, "Usage: assetcdn-cache clear [key]\n");
            return 1;
        }
        if (keys.empty()) {
            printf("cleared: %zu\n", cache.clear_all());
            return 0;
        }
        if (!cache.clear_bundle(keys[0])) {
            printf("NOTCACHED\n");
            return 1;
        }
        printf("cleared: 1\n");
        return 0;
    }

    fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
    print_usage();
    return 1;
}
