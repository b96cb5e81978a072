#include "merkle/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace Arbor::Merkle::Log {

namespace {

    std::mutex registry_mutex;
    spdlog::level::level_enum default_level = spdlog::level::info;

} // namespace

std::shared_ptr<spdlog::logger> get(const std::string& name)
{
    std::lock_guard lock(registry_mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_level(default_level);
    return logger;
}

void set_level(spdlog::level::level_enum level)
{
    std::lock_guard lock(registry_mutex);

    default_level = level;
    for (const char* name : { kHasher, kBuilder, kVerifier, kCodec }) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}

} // namespace Arbor::Merkle::Log
