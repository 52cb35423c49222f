/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "telemetry.hpp"
#include "core/logger.hpp"
#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace gsf::training {

    std::expected<TelemetryBackend, std::string> parse_telemetry_backend(std::string_view name) {
        if (name == "none") {
            return TelemetryBackend::None;
        }
        if (name == "local") {
            return TelemetryBackend::LocalDashboard;
        }
        return std::unexpected(std::format("Unknown telemetry backend '{}'. Valid options: none, local", name));
    }

    JsonlTelemetrySink::JsonlTelemetrySink(const std::filesystem::path& file_path)
        : _path(file_path) {
        if (_path.has_parent_path()) {
            std::filesystem::create_directories(_path.parent_path());
        }
        _file.open(_path, std::ios::out | std::ios::app);
        if (!_file.is_open()) {
            throw std::runtime_error(std::format("Could not open telemetry file: {}", _path.string()));
        }
        LOG_DEBUG("Writing metrics to {}", _path.string());
    }

    void JsonlTelemetrySink::log_scalar(std::string_view name, double value, int64_t iteration) {
        nlohmann::json record;
        record["iteration"] = iteration;
        record["name"] = std::string(name);
        record["value"] = value;
        _file << record.dump() << '\n';
    }

    void JsonlTelemetrySink::flush() {
        _file.flush();
    }

    std::unique_ptr<ITelemetrySink> make_telemetry_sink(TelemetryBackend backend,
                                                        const std::filesystem::path& output_path) {
        switch (backend) {
        case TelemetryBackend::LocalDashboard:
            return std::make_unique<JsonlTelemetrySink>(output_path / "metrics.jsonl");
        case TelemetryBackend::None:
            break;
        }
        return std::make_unique<NullTelemetrySink>();
    }
} // namespace gsf::training
