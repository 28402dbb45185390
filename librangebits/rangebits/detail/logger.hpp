// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace rangebits::detail {

/// Installs the configured sinks. Returns false on invalid settings.
bool setup_spdlog(const caf::settings& cfg);

/// Parses the console color mode: `automatic`, `always` or `never`.
std::optional<spdlog::color_mode> to_color_mode(std::string_view str);

void shutdown_spdlog();

/// The process-wide logger; discards everything until set up.
std::shared_ptr<spdlog::logger>& logger();

} // namespace rangebits::detail
