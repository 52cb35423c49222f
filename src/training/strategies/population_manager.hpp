/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "checkpoint.hpp"
#include "core/parameters.hpp"
#include "core/splat_data.hpp"
#include "densification_stats.hpp"
#include "optimizers/population_adam.hpp"
#include "rasterization/renderer.hpp"
#include <cstdint>
#include <optional>

namespace gsf::training {

    struct DensifyReport {
        int64_t size_before = 0;
        int64_t size_after_growth = 0; // before pruning and cap
        int64_t num_cloned = 0;
        int64_t num_split = 0;  // split parents; each one became two children
        int64_t num_pruned = 0; // includes newborns that were pruned right away
        int64_t num_capped = 0;
        int64_t created = 0;
        int64_t deleted = 0;
        int64_t size_after = 0;
    };

    /**
     * @brief Sole writer of the population, its gradient statistics and its optimizer state.
     *
     * Every structural change goes through one CompactionPlan applied to all three stores,
     * so that between calls size() == stats().size() == optimizer().size().
     */
    class PopulationManager {
    public:
        PopulationManager(SplatData&& splat_data, const param::OptimizationParameters& params);

        PopulationManager(const PopulationManager&) = delete;
        PopulationManager& operator=(const PopulationManager&) = delete;

        /**
         * Clone small and split large high-gradient primitives, prune transparent and
         * (with size_threshold) oversized ones, then enforce max_population by removing
         * the least opaque survivors. Throws ConfigurationError if a threshold is missing.
         */
        DensifyReport densify_and_prune(std::optional<float> grad_threshold,
                                        std::optional<float> percent_dense,
                                        float scene_extent,
                                        std::optional<float> size_threshold,
                                        std::optional<int64_t> max_population);

        // Clamp every opacity to at most the configured floor. Momentum is left untouched.
        void reset_opacity();

        bool escalate_sh_degree();

        void update_stats(const RenderOutput& render_output);

        // Optimizer step followed by clearing the gradients
        void step();
        void zero_grad();

        void set_position_lr(double lr) { _optimizer.set_lr(ParamId::Means, lr); }

        Checkpoint capture(int64_t iteration) const;

        // Replace population, statistics and optimizer state wholesale. Returns the
        // checkpoint's iteration. Throws CheckpointFormatError on a shape mismatch.
        int64_t restore(Checkpoint&& checkpoint);

        const SplatData& splat_data() const { return _splat_data; }
        const DensificationStats& stats() const { return _stats; }
        const PopulationAdam& optimizer() const { return _optimizer; }
        int64_t size() const { return _splat_data.size(); }

    private:
        const param::OptimizationParameters _params;
        SplatData _splat_data;
        DensificationStats _stats;
        PopulationAdam _optimizer;
    };

    std::array<PopulationAdam::Options, kParamCount> make_adam_options(const param::OptimizationParameters& params,
                                                                       float scene_extent);
} // namespace gsf::training
