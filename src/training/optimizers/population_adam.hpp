/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/compaction_plan.hpp"
#include <array>
#include <cstdint>
#include <torch/torch.h>
#include <tuple>

namespace gsf {
    class SplatData;
}

namespace gsf::training {
    /**
     * @brief Adam with explicit index-parallel moment buffers.
     *
     * One state entry per ParamId. Row i of every moment buffer belongs to primitive i,
     * so the state is resized with the same CompactionPlan that resizes the population
     * instead of being looked up by tensor identity.
     */
    class PopulationAdam {
    public:
        struct Options {
            Options(double lr = 1e-3) : lr_(lr) {
            }

            Options& lr(double lr) {
                lr_ = lr;
                return *this;
            }

            Options& betas(const std::tuple<double, double>& betas) {
                betas_ = betas;
                return *this;
            }

            Options& eps(double eps) {
                eps_ = eps;
                return *this;
            }

            double lr() const { return lr_; }
            const std::tuple<double, double>& betas() const { return betas_; }
            double eps() const { return eps_; }

        private:
            double lr_ = 1e-3;
            std::tuple<double, double> betas_ = std::make_tuple(0.9, 0.999);
            double eps_ = 1e-15;
        };

        struct ParamState {
            torch::Tensor exp_avg;
            torch::Tensor exp_avg_sq;
            int64_t step_count = 0;
        };

        // Moment buffers are allocated eagerly with zeros, one row per primitive
        PopulationAdam(const SplatData& splat_data, const std::array<Options, kParamCount>& options);

        void step(SplatData& splat_data);
        void zero_grad(SplatData& splat_data);

        void set_lr(ParamId id, double lr) { _options[to_index(id)].lr(lr); }
        double lr(ParamId id) const { return _options[to_index(id)].lr(); }

        ParamState& state(ParamId id) { return _states[to_index(id)]; }
        const ParamState& state(ParamId id) const { return _states[to_index(id)]; }

        int64_t size() const;

        // Survivors keep their moments. Warm-started newborns copy their parent's, the rest start at zero.
        void apply(const CompactionPlan& plan);

        void load_states(std::array<ParamState, kParamCount> states);

    private:
        std::array<Options, kParamCount> _options;
        std::array<ParamState, kParamCount> _states;
    };
} // namespace gsf::training
