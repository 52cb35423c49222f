/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "surface_alignment.hpp"

namespace gsf::training::losses {

    std::optional<SurfaceAlignmentTerms> surface_alignment_loss(const SplatData& splat_data,
                                                                const NeighborGraph& graph,
                                                                const torch::Tensor& rows_mask) {
        if (!graph.is_valid_for(splat_data) || splat_data.size() == 0) {
            return std::nullopt;
        }

        const auto device = splat_data.means().device();
        const auto is_surface = splat_data.types() == static_cast<int32_t>(PrimitiveType::Surface);
        const auto rows = (rows_mask.to(device, torch::kBool).reshape({-1}) & is_surface).nonzero().squeeze(-1);
        if (rows.size(0) == 0) {
            return std::nullopt;
        }

        const auto neighbors = graph.lookup(splat_data, rows);
        if (!neighbors) {
            return std::nullopt;
        }

        const auto valid = *neighbors >= 0; // [R, k]
        const auto num_pairs = valid.sum();
        if (num_pairs.item<int64_t>() == 0) {
            return std::nullopt;
        }

        const int64_t num_rows = rows.size(0);
        const int64_t k = neighbors->size(1);
        const auto flat_neighbors = neighbors->clamp_min(0).reshape({-1});

        const auto& means = splat_data.means();
        const auto normals = splat_data.get_normals();

        const auto mi = means.index_select(0, rows).unsqueeze(1);                                 // [R, 1, 3]
        const auto mj = means.index_select(0, flat_neighbors).reshape({num_rows, k, 3});         // [R, k, 3]
        const auto ni = normals.index_select(0, rows).unsqueeze(1);                               // [R, 1, 3]
        const auto nj = normals.index_select(0, flat_neighbors).reshape({num_rows, k, 3});       // [R, k, 3]

        const auto weights = valid.to(means.scalar_type());
        const auto denom = num_pairs.to(means.scalar_type());

        const auto pair_distance = ((mj - mi) * ni).sum(-1).abs();
        const auto pair_normal = 1.0f - (ni * nj).sum(-1).abs();

        return SurfaceAlignmentTerms{
            (pair_distance * weights).sum() / denom,
            (pair_normal * weights).sum() / denom};
    }
} // namespace gsf::training::losses
