// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace bctx::orch {

/// Name of the library logger in the spdlog registry
constexpr const char* LOGGER_NAME = "bctx.orch";

/// Shared library logger (stderr). Created on first use with the level
/// taken from BCTX_ORCH_LOG_LEVEL, default "info".
std::shared_ptr<spdlog::logger> logger();

/// @throws std::invalid_argument for an unknown level name
void set_log_level(const std::string& level);

}  // namespace bctx::orch
