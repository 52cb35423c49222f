/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/point_cloud.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <tinyply.h>

namespace gsf {

    namespace {
        std::optional<torch::ScalarType> to_scalar_type(tinyply::Type type) {
            switch (type) {
            case tinyply::Type::FLOAT32: return torch::kFloat32;
            case tinyply::Type::FLOAT64: return torch::kFloat64;
            case tinyply::Type::INT32: return torch::kInt32;
            case tinyply::Type::INT16: return torch::kInt16;
            case tinyply::Type::INT8: return torch::kInt8;
            case tinyply::Type::UINT8: return torch::kUInt8;
            default: return std::nullopt;
            }
        }

        // Copies a property block into an owning [count, cols] tensor of its stored type
        torch::Tensor to_tensor(tinyply::PlyData& data, int64_t cols, const char* what) {
            const auto scalar_type = to_scalar_type(data.t);
            if (!scalar_type) {
                throw std::runtime_error(std::format("Unsupported PLY data type for {}", what));
            }
            return torch::from_blob(data.buffer.get(),
                                    {static_cast<int64_t>(data.count), cols},
                                    torch::TensorOptions().dtype(*scalar_type))
                .clone();
        }
    } // namespace

    std::expected<PointCloud, std::string> load_point_cloud_ply(const std::filesystem::path& filepath) {
        if (!std::filesystem::exists(filepath)) {
            return std::unexpected(std::format("PLY file does not exist: {}", filepath.string()));
        }

        std::ifstream stream(filepath, std::ios::binary);
        if (!stream) {
            return std::unexpected(std::format("Failed to open PLY file: {}", filepath.string()));
        }

        try {
            tinyply::PlyFile file;
            file.parse_header(stream);

            std::shared_ptr<tinyply::PlyData> vertices;
            try {
                vertices = file.request_properties_from_element("vertex", {"x", "y", "z"});
            } catch (const std::exception& e) {
                return std::unexpected(std::format("PLY file missing vertex positions: {}", e.what()));
            }

            // Optional properties: tinyply throws when they are absent
            std::shared_ptr<tinyply::PlyData> colors;
            try {
                colors = file.request_properties_from_element("vertex", {"red", "green", "blue"});
            } catch (const std::exception&) {
                LOG_DEBUG("PLY file has no color data, seeding with grey");
            }
            std::shared_ptr<tinyply::PlyData> types;
            try {
                types = file.request_properties_from_element("vertex", {"type"});
            } catch (const std::exception&) {
                LOG_DEBUG("PLY file has no type property, the configured default applies");
            }

            file.read(stream);

            if (!vertices || vertices->count == 0) {
                return std::unexpected(std::format("PLY file has no vertices: {}", filepath.string()));
            }

            PointCloud cloud(to_tensor(*vertices, 3, "positions").to(torch::kFloat32), torch::Tensor());
            if (colors && colors->count == vertices->count) {
                auto rgb = to_tensor(*colors, 3, "colors");
                cloud.colors = rgb.dtype() == torch::kUInt8 ? rgb : rgb.to(torch::kFloat32);
            }
            if (types && types->count == vertices->count) {
                cloud.types = to_tensor(*types, 1, "types").reshape({-1}).to(torch::kInt32);
            }

            LOG_INFO("Loaded point cloud with {} points from {}", cloud.size(), filepath.string());
            return cloud;

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to load PLY file {}: {}", filepath.string(), e.what()));
        }
    }

} // namespace gsf
