#pragma once

#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace Arbor::Merkle::Log {

inline constexpr const char* kHasher = "arbor:merkle:hasher";
inline constexpr const char* kBuilder = "arbor:merkle:builder";
inline constexpr const char* kVerifier = "arbor:merkle:verifier";
inline constexpr const char* kCodec = "arbor:merkle:codec";

// Returns the named logger, registering a stderr sink on first use.
std::shared_ptr<spdlog::logger> get(const std::string& name);

// Applies `level` to every logger created through get().
void set_level(spdlog::level::level_enum level);

} // namespace Arbor::Merkle::Log
