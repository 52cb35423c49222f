/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "dataset.hpp"
#include <stdexcept>

namespace gsf::training {
    float compute_scene_extent(const torch::Tensor& camera_centers) {
        if (!camera_centers.defined() || camera_centers.size(0) == 0) {
            throw std::invalid_argument("compute_scene_extent: no camera centers");
        }
        const auto centers = camera_centers.to(torch::kFloat32).reshape({-1, 3});
        const auto avg = centers.mean(0, /*keepdim=*/true);
        const auto dists = torch::norm(centers - avg, 2, 1);
        return dists.max().item<float>() * 1.1f;
    }

    size_t ViewSampler::next() {
        if (_num_views == 0) {
            throw std::runtime_error("ViewSampler: no training views");
        }
        if (_stack.empty()) {
            auto perm = torch::randperm(static_cast<int64_t>(_num_views), torch::kInt64);
            _stack.assign(perm.data_ptr<int64_t>(), perm.data_ptr<int64_t>() + perm.numel());
        }
        const auto idx = _stack.back();
        _stack.pop_back();
        return static_cast<size_t>(idx);
    }
} // namespace gsf::training
