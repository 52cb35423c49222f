/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

/**
 * @file checkpoint.hpp
 * @brief Training checkpoint format (.pt files, libtorch archive)
 *
 * Archive keys:
 *   header/magic, header/version      format identification
 *   state/iteration                   iteration the snapshot was taken after
 *   state/active_sh_degree, state/max_sh_degree, state/scene_scale
 *   splat/<param>, splat/types        population tensors, see ParamId
 *   adam/<param>/exp_avg, adam/<param>/exp_avg_sq, adam/<param>/step
 */

#include "core/compaction_plan.hpp"
#include "core/splat_data.hpp"
#include "optimizers/population_adam.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <torch/torch.h>

namespace gsf::training {

    constexpr int64_t CHECKPOINT_MAGIC = 0x47534650; // "GSFP"
    constexpr int64_t CHECKPOINT_VERSION = 1;

    // Immutable snapshot of the population, its optimizer state and the training counters
    struct Checkpoint {
        int64_t iteration = 0;
        int active_sh_degree = 0;
        int max_sh_degree = 0;
        float scene_scale = 0.f;

        std::array<torch::Tensor, kParamCount> params;
        torch::Tensor types;
        std::array<PopulationAdam::ParamState, kParamCount> optimizer;

        int64_t size() const {
            const auto& means = params[to_index(ParamId::Means)];
            return means.defined() ? means.size(0) : 0;
        }
    };

    struct CheckpointSummary {
        int64_t iteration = 0;
        int64_t size = 0;
        int active_sh_degree = 0;
        int max_sh_degree = 0;
        float scene_scale = 0.f;
        int64_t num_surface = 0;
        int64_t num_generic = 0;
        int64_t optimizer_steps = 0;
        float opacity_min = 0.f;
        float opacity_mean = 0.f;
        float opacity_max = 0.f;
    };

    CheckpointSummary summarize_checkpoint(const Checkpoint& checkpoint);

    // Throws CheckpointFormatError unless every tensor has the row count and trailing
    // shape implied by the checkpoint's own SH degree.
    void validate_checkpoint(const Checkpoint& checkpoint);

    // Population held by a checkpoint, on the given device. Validates first.
    SplatData make_splat_data(const Checkpoint& checkpoint, const torch::Device& device, bool requires_grad);

    std::expected<void, std::string> save_checkpoint(const Checkpoint& checkpoint,
                                                     const std::filesystem::path& path);

    std::expected<Checkpoint, std::string> load_checkpoint(const std::filesystem::path& path);

} // namespace gsf::training
