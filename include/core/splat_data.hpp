/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/compaction_plan.hpp"
#include "core/point_cloud.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace gsf {
    namespace param {
        struct TrainingParameters;
    }

    enum class PrimitiveType : int32_t {
        Generic = 0,
        Surface = 1
    };

    // Rotation matrices [..., 3, 3] from (w, x, y, z) quaternions [..., 4]
    torch::Tensor quat_to_rotmat(const torch::Tensor& quats);

    /**
     * @brief The live primitive population.
     *
     * An arena of index-parallel tensors with a single authoritative length, size().
     * Rows have no identity beyond their current index. generation() increases on every
     * structural mutation so that index-based data derived from an older layout can be
     * recognised as stale.
     */
    class SplatData {
    public:
        SplatData() = default;

        SplatData(const SplatData&) = delete;
        SplatData& operator=(const SplatData&) = delete;
        SplatData(SplatData&&) noexcept = default;
        SplatData& operator=(SplatData&&) noexcept = default;

        SplatData(int sh_degree,
                  torch::Tensor means,
                  torch::Tensor sh0,
                  torch::Tensor shN,
                  torch::Tensor scaling,
                  torch::Tensor rotation,
                  torch::Tensor opacity,
                  torch::Tensor types,
                  float scene_scale);

        // Static factory method to create from PointCloud
        static std::expected<SplatData, std::string> init_model_from_pointcloud(
            const param::TrainingParameters& params,
            const PointCloud& point_cloud,
            float scene_extent);

        // Activated getters
        torch::Tensor get_means() const;
        torch::Tensor get_opacity() const;  // [N] in [0, 1]
        torch::Tensor get_rotation() const; // [N, 4] unit quaternions
        torch::Tensor get_scaling() const;  // [N, 3] positive
        torch::Tensor get_shs() const;
        torch::Tensor get_normals() const;  // [N, 3] third axis of each rotation

        int get_active_sh_degree() const { return _active_sh_degree; }
        int get_max_sh_degree() const { return _max_sh_degree; }
        float get_scene_scale() const { return _scene_scale; }
        int64_t size() const { return _means.defined() ? _means.size(0) : 0; }
        uint64_t generation() const { return _generation; }

        // Raw tensor access for optimization
        inline torch::Tensor& means() { return _means; }
        inline const torch::Tensor& means() const { return _means; }
        inline torch::Tensor& opacity_raw() { return _opacity; }
        inline const torch::Tensor& opacity_raw() const { return _opacity; }
        inline torch::Tensor& rotation_raw() { return _rotation; }
        inline const torch::Tensor& rotation_raw() const { return _rotation; }
        inline torch::Tensor& scaling_raw() { return _scaling; }
        inline const torch::Tensor& scaling_raw() const { return _scaling; }
        inline torch::Tensor& sh0() { return _sh0; }
        inline const torch::Tensor& sh0() const { return _sh0; }
        inline torch::Tensor& shN() { return _shN; }
        inline const torch::Tensor& shN() const { return _shN; }
        inline const torch::Tensor& types() const { return _types; }

        torch::Tensor& param(ParamId id);
        const torch::Tensor& param(ParamId id) const;

        int64_t count(PrimitiveType type) const;

        // Returns true if the active degree changed
        bool increment_sh_degree();
        void set_active_sh_degree(int sh_degree);

        // Rebuild every tensor from the plan. Bumps the generation.
        void apply(const CompactionPlan& plan);

        // Take over another population wholesale. Bumps the generation past both.
        void replace(SplatData&& other);

        void save_ply(const std::filesystem::path& file_path) const;

        // Get attribute names for the PLY format
        std::vector<std::string> get_attribute_names() const;

    private:
        int _active_sh_degree = 0;
        int _max_sh_degree = 0;
        float _scene_scale = 0.f;
        uint64_t _generation = 0;

        torch::Tensor _means;
        torch::Tensor _sh0;
        torch::Tensor _shN;
        torch::Tensor _scaling;
        torch::Tensor _rotation;
        torch::Tensor _opacity;
        torch::Tensor _types;
    };
} // namespace gsf
