#include "blobfeed/core/platform_utils.hpp"
#include "blobfeed/feed/blob_client.hpp"
#include "blobfeed/feed/cursor_store.hpp"
#include "blobfeed/feed/options.hpp"
#include "blobfeed/feed/sequencer.hpp"
#include "blobfeed/log.hpp"
#include "tools/event_json.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

using blobfeed::core::CancellationToken;
using blobfeed::core::error;
using blobfeed::feed::FeedNotice;
using blobfeed::feed::FeedOptions;

namespace fs = std::filesystem;

namespace {
struct Args {
    std::string root_dir;             // local mirror of the storage account
    std::string cursor_dir{".blobfeed"};
    std::string feed{"tail"};
    std::optional<std::string> container;
    std::optional<std::string> start;
    std::optional<std::string> end;
    std::optional<std::string> token;
    std::size_t batch{0};             // 0 => options/env default
    bool once{false};                 // stop at the first caught-up poll
    bool control{false};
    bool print_token{false};
};

CancellationToken g_cancel;
volatile std::sig_atomic_t g_signalled = 0;

extern "C" void on_signal(int) { g_signalled = 1; }

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "blobfeed_tail: prints change-feed events of a local storage mirror as JSON lines\n"
              << "Usage: blobfeed_tail --root=DIR [--cursor_dir=DIR] [--feed=ID] [--container=NAME]\n"
              << "  [--start=ISO8601] [--end=ISO8601] [--token=bfc1...] [--batch=N]\n"
              << "  [--once] [--control] [--print_token]\n"
              << "Environment: BLOBFEED_POLL_INTERVAL_MS, BLOBFEED_SHARD_CONCURRENCY, BLOBFEED_BATCH_MAX_EVENTS,\n"
              << "  BLOBFEED_BATCH_MAX_WAIT_MS, BLOBFEED_START_TIME, BLOBFEED_END_TIME, BLOBFEED_CONTAINER,\n"
              << "  BLOBFEED_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        if (auto v = eat(a, "--root=")) { args.root_dir = *v; continue; }
        if (auto v = eat(a, "--cursor_dir=")) { args.cursor_dir = *v; continue; }
        if (auto v = eat(a, "--feed=")) { args.feed = *v; continue; }
        if (auto v = eat(a, "--container=")) { args.container = *v; continue; }
        if (auto v = eat(a, "--start=")) { args.start = *v; continue; }
        if (auto v = eat(a, "--end=")) { args.end = *v; continue; }
        if (auto v = eat(a, "--token=")) { args.token = *v; continue; }
        if (auto v = eat(a, "--batch=")) {
            auto n = blobfeed::core::parse_u64(*v);
            if (!n) { std::cerr << "invalid --batch: " << *v << "\n"; return 2; }
            args.batch = static_cast<std::size_t>(*n);
            continue;
        }
        if (a == "--once") { args.once = true; continue; }
        if (a == "--control") { args.control = true; continue; }
        if (a == "--print_token") { args.print_token = true; continue; }
        std::cerr << "unknown argument: " << a << "\n";
        print_usage();
        return 2;
    }
    if (args.root_dir.empty()) { print_usage(); return 2; }

    FeedOptions base;
    base.feed_identity = args.feed;
    base.deliver_control_events = args.control;
    base.continuation_token = args.token;
    auto opts = blobfeed::feed::feed_options_from_env(base);
    if (!opts) { std::cerr << blobfeed::core::describe(opts.error()) << "\n"; return 2; }
    if (args.container) opts->container = args.container;
    if (args.batch) opts->batch_max_events = args.batch;
    for (auto [text, slot] : {std::pair{&args.start, &opts->start_time}, std::pair{&args.end, &opts->end_time}}) {
        if (!*text) continue;
        auto t = blobfeed::core::parse_timestamp(**text);
        if (!t) { std::cerr << blobfeed::core::describe(t.error()) << "\n"; return 2; }
        *slot = *t;
    }

    auto client = std::make_shared<blobfeed::feed::LocalDirBlobClient>(fs::path(args.root_dir));
    auto store = std::make_shared<blobfeed::feed::FileCursorStore>(fs::path(args.cursor_dir));
    auto feed = blobfeed::feed::FeedSequencer::create(client, store, *opts, g_cancel);
    if (!feed) { std::cerr << blobfeed::core::describe(feed.error()) << "\n"; return 2; }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    // Signal handlers may not lock; a watcher forwards the flag to the token.
    std::atomic<bool> done{false};
    std::thread watcher([&done] {
        while (!done.load()) {
            if (g_signalled) { g_cancel.request_stop(); return; }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::uint64_t printed = 0;
    auto consumer = [&](const FeedNotice& n) -> std::expected<void, error> {
        switch (n.kind) {
            case FeedNotice::Kind::events:
                for (const auto& pe : n.events) std::cout << blobfeed::tools::event_json_line(pe) << "\n";
                std::cout.flush();
                printed += n.events.size();
                break;
            case FeedNotice::Kind::shard_stalled:
                for (const auto& s : n.stalled) {
                    BLOBFEED_LOG_WARN("shard {} stalled in {}: {}", s.cursor.shard_id, s.segment_id, s.reason);
                }
                break;
            case FeedNotice::Kind::caught_up:
                BLOBFEED_LOG_DEBUG("caught up at segment {}", n.segment_id);
                if (args.once) g_cancel.request_stop();
                break;
        }
        return {};
    };

    auto r = (*feed)->run(consumer);
    done.store(true);
    watcher.join();
    if (args.print_token) {
        std::cerr << "continuation token: " << blobfeed::feed::to_continuation_token((*feed)->checkpoint()) << "\n";
    }
    BLOBFEED_LOG_INFO("printed {} event(s)", printed);
    if (!r) {
        std::cerr << blobfeed::core::describe(r.error()) << "\n";
        return 1;
    }
    return 0;
}
