/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "neighbor_graph.hpp"
#include "core/kdtree.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace gsf::training {

    std::optional<torch::Tensor> NeighborGraph::lookup(const SplatData& splat_data, const torch::Tensor& rows) const {
        if (!is_valid_for(splat_data)) {
            return std::nullopt;
        }
        return _indices.index_select(0, rows.to(_indices.device(), torch::kInt64));
    }

    std::optional<torch::Tensor> NeighborGraph::indices(const SplatData& splat_data) const {
        if (!is_valid_for(splat_data)) {
            return std::nullopt;
        }
        return _indices;
    }

    NeighborGraph NeighborGraphBuilder::rebuild(const SplatData& splat_data) const {
        LOG_TIMER("NeighborGraphBuilder::rebuild");

        if (_k <= 0) {
            throw std::invalid_argument("NeighborGraphBuilder: k must be positive");
        }

        const int64_t n = splat_data.size();
        auto table = torch::full({n, static_cast<int64_t>(_k)}, -1, torch::kInt64);
        if (n == 0) {
            return NeighborGraph(table, splat_data.generation(), n);
        }

        const auto types = splat_data.types().to(torch::kCPU);
        const auto surface_rows = (types == static_cast<int32_t>(PrimitiveType::Surface)).nonzero().squeeze(-1).contiguous();
        const int64_t num_surface = surface_rows.size(0);

        if (num_surface > 1) {
            const auto points = splat_data.means().detach().index_select(0, surface_rows.to(splat_data.means().device()))
                                    .to(torch::kCPU, torch::kFloat32)
                                    .contiguous();
            const float* data = points.data_ptr<float>();
            const int64_t* global = surface_rows.data_ptr<int64_t>();

            core::PointCloudAdaptor cloud(data, static_cast<size_t>(num_surface));
            core::KDTree index(3, cloud, nanoflann::KDTreeSingleIndexAdaptorParams(core::kKDTreeLeafSize));
            index.buildIndex();

            // One extra result because the query point finds itself
            const size_t num_results = static_cast<size_t>(std::min<int64_t>(_k + 1, num_surface));
            std::vector<size_t> ret_indices(num_results);
            std::vector<float> out_dists_sqr(num_results);

            auto accessor = table.accessor<int64_t, 2>();
            for (int64_t i = 0; i < num_surface; ++i) {
                const float* query_pt = data + i * 3;

                nanoflann::KNNResultSet<float> resultSet(num_results);
                resultSet.init(&ret_indices[0], &out_dists_sqr[0]);
                index.findNeighbors(resultSet, query_pt, nanoflann::SearchParameters());

                const int64_t row = global[i];
                int64_t slot = 0;
                for (size_t j = 0; j < resultSet.size() && slot < _k; ++j) {
                    if (ret_indices[j] == static_cast<size_t>(i)) {
                        continue;
                    }
                    accessor[row][slot++] = global[ret_indices[j]];
                }
            }
        }

        LOG_DEBUG("Neighbor graph rebuilt over {} surface primitives (k={})", num_surface, _k);
        return NeighborGraph(table.to(splat_data.means().device()), splat_data.generation(), n);
    }
} // namespace gsf::training
