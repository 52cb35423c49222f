/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/compaction_plan.hpp"
#include <cstdint>
#include <torch/torch.h>

namespace gsf::training {
    /**
     * @brief Per-primitive running statistics that drive densification.
     *
     * grad_accum: sum of view-space positional gradient norms over visible iterations
     * denom:      number of iterations in which the primitive was visible
     * max_radii:  largest screen-space radius observed while visible
     */
    class DensificationStats {
    public:
        DensificationStats() = default;
        DensificationStats(int64_t num_primitives, torch::Device device);

        // viewspace_grad is [..., N, >=2]; visibility and radii are [..., N].
        // Leading camera dimensions are reduced. An undefined gradient counts as zero.
        void update(const torch::Tensor& viewspace_grad,
                    const torch::Tensor& visibility,
                    const torch::Tensor& radii);

        // grad_accum / denom, and 0 where the primitive was never visible
        torch::Tensor average_grad() const;

        void apply(const CompactionPlan& plan);
        void reset();

        int64_t size() const { return _grad_accum.defined() ? _grad_accum.size(0) : 0; }

        const torch::Tensor& grad_accum() const { return _grad_accum; }
        const torch::Tensor& denom() const { return _denom; }
        const torch::Tensor& max_radii() const { return _max_radii; }

    private:
        torch::Tensor _grad_accum;
        torch::Tensor _denom;
        torch::Tensor _max_radii;
    };
} // namespace gsf::training
