/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/splat_data.hpp"
#include <cstdint>
#include <optional>
#include <torch/torch.h>

namespace gsf::training {

    /**
     * @brief k-nearest-neighbour index over the surface primitives of one population layout.
     *
     * indices is [N, k] int64. Rows of surface primitives hold global row numbers of their
     * nearest surface neighbours, padded with -1. Other rows are all -1. The graph is only
     * meaningful for the layout it was built from; lookup() refuses to hand out indices
     * once the population has been mutated.
     */
    class NeighborGraph {
    public:
        NeighborGraph() = default;
        NeighborGraph(torch::Tensor indices, uint64_t generation, int64_t size)
            : _indices(std::move(indices)),
              _generation(generation),
              _size(size),
              _built(true) {
        }

        bool is_valid_for(const SplatData& splat_data) const {
            return _built && _generation == splat_data.generation() && _size == splat_data.size();
        }

        // Neighbour rows for the given primitive rows, or nullopt if the graph is stale
        std::optional<torch::Tensor> lookup(const SplatData& splat_data, const torch::Tensor& rows) const;

        // Whole table, or nullopt if the graph is stale
        std::optional<torch::Tensor> indices(const SplatData& splat_data) const;

        int64_t k() const { return _indices.defined() ? _indices.size(1) : 0; }
        bool built() const { return _built; }

    private:
        torch::Tensor _indices;
        uint64_t _generation = 0;
        int64_t _size = 0;
        bool _built = false;
    };

    class NeighborGraphBuilder {
    public:
        explicit NeighborGraphBuilder(int k = 10) : _k(k) {}

        NeighborGraph rebuild(const SplatData& splat_data) const;

        int k() const { return _k; }

    private:
        int _k;
    };
} // namespace gsf::training
