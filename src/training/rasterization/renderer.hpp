/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/splat_data.hpp"
#include <torch/torch.h>

namespace gsf::training {
    struct CameraView;

    struct RenderOutput {
        torch::Tensor image;      // [3, H, W]
        torch::Tensor depth;      // [1, H, W]
        torch::Tensor depth_loss; // scalar, undefined if the renderer has none
        torch::Tensor means2d;    // [..., N, 2], requires grad; backward fills its .grad()
        torch::Tensor visibility; // [..., N] bool
        torch::Tensor radii;      // [..., N] screen-space radius in pixels
    };

    /**
     * @brief Differentiable rasterizer seam.
     *
     * Implementations must read the population through the const reference and the
     * current size() on every call: the row count changes across densification.
     */
    class IRenderer {
    public:
        virtual ~IRenderer() = default;

        virtual RenderOutput render(const SplatData& splat_data,
                                    const CameraView& camera,
                                    const torch::Tensor& background) = 0;
    };
} // namespace gsf::training
