/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace gsf::training {

    enum class TelemetryBackend {
        None,
        LocalDashboard
    };

    std::expected<TelemetryBackend, std::string> parse_telemetry_backend(std::string_view name);

    // Receives scalar metrics keyed by name and iteration. A remote experiment tracker
    // integrates by implementing this interface.
    class ITelemetrySink {
    public:
        virtual ~ITelemetrySink() = default;

        virtual void log_scalar(std::string_view name, double value, int64_t iteration) = 0;
        virtual void flush() {}
    };

    class NullTelemetrySink : public ITelemetrySink {
    public:
        void log_scalar(std::string_view, double, int64_t) override {}
    };

    // One JSON object per line: {"iteration": i, "name": "...", "value": v}
    class JsonlTelemetrySink : public ITelemetrySink {
    public:
        explicit JsonlTelemetrySink(const std::filesystem::path& file_path);

        void log_scalar(std::string_view name, double value, int64_t iteration) override;
        void flush() override;

        const std::filesystem::path& path() const { return _path; }

    private:
        std::filesystem::path _path;
        std::ofstream _file;
    };

    std::unique_ptr<ITelemetrySink> make_telemetry_sink(TelemetryBackend backend,
                                                        const std::filesystem::path& output_path);
} // namespace gsf::training
