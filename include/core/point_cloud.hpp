/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <torch/torch.h>

namespace gsf {

    // Scene-derived seed for the initial population
    struct PointCloud {
        torch::Tensor means;  // [N, 3] float32
        torch::Tensor colors; // [N, 3] uint8 or float32

        // Optional per-point primitive type, [N] int32. Empty means "use the configured default".
        torch::Tensor types;

        PointCloud(torch::Tensor pos, torch::Tensor col)
            : means(std::move(pos)),
              colors(std::move(col)) {}

        PointCloud() = default;

        int64_t size() const {
            return means.defined() ? means.size(0) : 0;
        }

        bool has_types() const {
            return types.defined() && types.numel() == size();
        }
    };

    /**
     * @brief Read a seed point cloud from a PLY file
     *
     * Requires vertex x/y/z (float or double). red/green/blue (uchar or float) and an
     * integer `type` property are picked up when present.
     */
    std::expected<PointCloud, std::string> load_point_cloud_ply(const std::filesystem::path& filepath);

} // namespace gsf
