/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <torch/torch.h>

namespace gsf {

    // Optimisable per-primitive parameters, in storage order
    enum class ParamId : uint8_t {
        Means = 0,
        Sh0 = 1,
        ShN = 2,
        Scaling = 3,
        Rotation = 4,
        Opacity = 5
    };

    inline constexpr size_t kParamCount = 6;

    inline constexpr std::array<ParamId, kParamCount> kAllParams = {
        ParamId::Means, ParamId::Sh0, ParamId::ShN,
        ParamId::Scaling, ParamId::Rotation, ParamId::Opacity};

    constexpr size_t to_index(ParamId id) { return static_cast<size_t>(id); }

    const char* param_name(ParamId id);

    /**
     * @brief Single keep/replace index map describing one population mutation.
     *
     * Every index-parallel store (parameters, gradient statistics, optimizer moments)
     * consumes the same plan, so they stay aligned. The new layout is
     * [ old rows listed in keep..., newborn rows... ], survivors in their previous
     * order followed by newborns in creation order.
     */
    struct CompactionPlan {
        torch::Tensor keep;       // [S] int64, ascending rows of the current arrays
        torch::Tensor parents;    // [B] int64, source row of each newborn
        torch::Tensor warm_start; // [B] bool, newborn inherits the parent's optimizer moments

        std::array<torch::Tensor, kParamCount> born; // raw parameter rows of the newborns
        torch::Tensor born_types;                    // [B] int32

        int64_t num_kept() const { return keep.defined() ? keep.size(0) : 0; }
        int64_t num_born() const { return parents.defined() ? parents.size(0) : 0; }
        int64_t new_size() const { return num_kept() + num_born(); }
    };

} // namespace gsf
