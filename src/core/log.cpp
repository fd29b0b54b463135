#include "blobfeed/log.hpp"
#include "blobfeed/core/platform_utils.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace blobfeed::log {

namespace {

std::mutex g_mu;
std::shared_ptr<spdlog::logger> g_logger;

auto make_default() -> std::shared_ptr<spdlog::logger> {
  auto existing = spdlog::get("blobfeed");
  auto lg = existing ? existing : spdlog::stderr_color_mt("blobfeed");
  auto lvl = spdlog::level::info;
  if (auto v = core::safe_getenv("BLOBFEED_LOG_LEVEL"); v && !v->empty()) {
    lvl = spdlog::level::from_str(*v); // unknown names map to off
  }
  lg->set_level(lvl);
  return lg;
}

} // namespace

auto get() -> std::shared_ptr<spdlog::logger> {
  std::lock_guard<std::mutex> lk(g_mu);
  if (!g_logger) g_logger = make_default();
  return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_logger = std::move(logger);
}

} // namespace blobfeed::log
