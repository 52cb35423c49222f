/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/splat_data.hpp"
#include "strategies/neighbor_graph.hpp"
#include <optional>
#include <torch/torch.h>

namespace gsf::training::losses {

    struct SurfaceAlignmentTerms {
        torch::Tensor distance; // mean |(x_j - x_i) . n_i| over neighbour pairs
        torch::Tensor normal;   // mean 1 - |n_i . n_j| over neighbour pairs
    };

    // Geometric consistency between surface primitives and their graph neighbours.
    // rows_mask selects the primitives to regularise, typically the visible ones.
    // Returns nullopt when the graph is stale for this population or no pair exists.
    std::optional<SurfaceAlignmentTerms> surface_alignment_loss(const SplatData& splat_data,
                                                                const NeighborGraph& graph,
                                                                const torch::Tensor& rows_mask);
} // namespace gsf::training::losses
