/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "densification_stats.hpp"
#include <format>
#include <stdexcept>

namespace gsf::training {
    DensificationStats::DensificationStats(int64_t num_primitives, torch::Device device) {
        const auto f32 = torch::TensorOptions().dtype(torch::kFloat32).device(device);
        _grad_accum = torch::zeros({num_primitives}, f32);
        _denom = torch::zeros({num_primitives}, f32);
        _max_radii = torch::zeros({num_primitives}, f32);
    }

    void DensificationStats::update(const torch::Tensor& viewspace_grad,
                                    const torch::Tensor& visibility,
                                    const torch::Tensor& radii) {
        torch::NoGradGuard no_grad;

        const int64_t n = size();
        if (n == 0) {
            return;
        }
        if (visibility.size(-1) != n || radii.size(-1) != n) {
            throw std::runtime_error(std::format(
                "DensificationStats::update: expected {} primitives, got visibility {} and radii {}",
                n, visibility.size(-1), radii.size(-1)));
        }

        const auto device = _grad_accum.device();
        const torch::Tensor visible = visibility.to(device, torch::kBool).reshape({-1, n}).any(0);

        torch::Tensor norms;
        if (viewspace_grad.defined()) {
            if (viewspace_grad.dim() < 2 || viewspace_grad.size(-2) != n || viewspace_grad.size(-1) < 2) {
                throw std::runtime_error(std::format(
                    "DensificationStats::update: view-space gradient must be [..., {}, >=2]", n));
            }
            torch::Tensor grads = viewspace_grad.detach().index({"...", torch::indexing::Slice(0, 2)});
            if (!torch::isfinite(grads).all().item<bool>()) {
                throw std::runtime_error("Gradient contains NaN or Inf values.");
            }
            norms = grads.norm(2, -1).reshape({-1, n}).sum(0).to(device, torch::kFloat32);
        } else {
            norms = torch::zeros_like(_grad_accum);
        }

        const torch::Tensor current_radii = std::get<0>(radii.detach().to(device, torch::kFloat32).reshape({-1, n}).max(0));

        _grad_accum.add_(torch::where(visible, norms, torch::zeros_like(norms)));
        _denom.add_(visible.to(torch::kFloat32));
        _max_radii = torch::where(visible, torch::max(_max_radii, current_radii), _max_radii);
    }

    torch::Tensor DensificationStats::average_grad() const {
        return torch::where(_denom > 0,
                            _grad_accum / _denom.clamp_min(1.0f),
                            torch::zeros_like(_grad_accum));
    }

    void DensificationStats::apply(const CompactionPlan& plan) {
        const auto keep = plan.keep.to(_grad_accum.device());
        const auto zeros = torch::zeros({plan.num_born()}, _grad_accum.options());

        _grad_accum = torch::cat({_grad_accum.index_select(0, keep), zeros});
        _denom = torch::cat({_denom.index_select(0, keep), zeros});
        _max_radii = torch::cat({_max_radii.index_select(0, keep), zeros});
    }

    void DensificationStats::reset() {
        _grad_accum.zero_();
        _denom.zero_();
        _max_radii.zero_();
    }
} // namespace gsf::training
