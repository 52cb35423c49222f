/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "population_adam.hpp"
#include "core/splat_data.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace gsf::training {
    PopulationAdam::PopulationAdam(const SplatData& splat_data, const std::array<Options, kParamCount>& options)
        : _options(options) {
        for (auto id : kAllParams) {
            const auto& param = splat_data.param(id);
            auto& state = _states[to_index(id)];
            state.exp_avg = torch::zeros_like(param).contiguous();
            state.exp_avg_sq = torch::zeros_like(param).contiguous();
            state.step_count = 0;
        }
    }

    void PopulationAdam::step(SplatData& splat_data) {
        torch::NoGradGuard no_grad;

        for (auto id : kAllParams) {
            auto& param = splat_data.param(id);
            if (!param.grad().defined()) {
                continue;
            }

            auto& state = _states[to_index(id)];
            if (state.exp_avg.size(0) != param.size(0)) {
                throw std::runtime_error("PopulationAdam: optimizer state is out of sync with the population");
            }

            const auto& opts = _options[to_index(id)];
            const auto [beta1, beta2] = opts.betas();
            state.step_count++;

            const double bias_correction1_rcp = 1.0 / (1.0 - std::pow(beta1, state.step_count));
            const double bias_correction2_sqrt_rcp = 1.0 / std::sqrt(1.0 - std::pow(beta2, state.step_count));

            const auto& grad = param.grad();
            state.exp_avg.mul_(beta1).add_(grad, 1.0 - beta1);
            state.exp_avg_sq.mul_(beta2).addcmul_(grad, grad, 1.0 - beta2);

            auto denom = (state.exp_avg_sq.sqrt() * bias_correction2_sqrt_rcp).add_(opts.eps());
            param.addcdiv_(state.exp_avg, denom, -opts.lr() * bias_correction1_rcp);
        }
    }

    void PopulationAdam::zero_grad(SplatData& splat_data) {
        for (auto id : kAllParams) {
            auto& param = splat_data.param(id);
            if (param.mutable_grad().defined()) {
                param.mutable_grad().reset();
            }
        }
    }

    int64_t PopulationAdam::size() const {
        const auto& means = _states[to_index(ParamId::Means)].exp_avg;
        return means.defined() ? means.size(0) : 0;
    }

    void PopulationAdam::apply(const CompactionPlan& plan) {
        torch::NoGradGuard no_grad;

        const int64_t num_born = plan.num_born();

        for (auto& state : _states) {
            const auto device = state.exp_avg.device();
            const auto keep = plan.keep.to(device);

            const auto migrate = [&](const torch::Tensor& buffer) {
                auto kept = buffer.index_select(0, keep);
                if (num_born == 0) {
                    return kept.contiguous();
                }
                const auto parents = plan.parents.to(device);
                std::vector<int64_t> mask_shape(buffer.dim(), 1);
                mask_shape[0] = num_born;
                const auto warm = plan.warm_start.to(device).view(mask_shape);

                auto inherited = buffer.index_select(0, parents);
                auto born = torch::where(warm, inherited, torch::zeros_like(inherited));
                return torch::cat({kept, born}, 0).contiguous();
            };

            state.exp_avg = migrate(state.exp_avg);
            state.exp_avg_sq = migrate(state.exp_avg_sq);
        }
    }

    void PopulationAdam::load_states(std::array<ParamState, kParamCount> states) {
        _states = std::move(states);
    }
} // namespace gsf::training
