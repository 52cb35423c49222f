/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/splat_data.hpp"
#include "core/kdtree.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "core/point_cloud.hpp"

#include <algorithm>
#include <cmath>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tinyply.h>
#include <torch/torch.h>
#include <vector>

namespace {
    std::string tensor_sizes_to_string(const c10::ArrayRef<int64_t>& sizes) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < sizes.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << sizes[i];
        }
        oss << "]";
        return oss.str();
    }

    // Mean squared distance to the 3 nearest neighbours of each point
    torch::Tensor compute_mean_squared_neighbor_distances(const torch::Tensor& points) {
        auto cpu_points = points.to(torch::kCPU).contiguous();
        const int64_t num_points = cpu_points.size(0);

        TORCH_CHECK(cpu_points.dim() == 2 && cpu_points.size(1) == 3,
                    "Input points must have shape [N, 3]");
        TORCH_CHECK(cpu_points.dtype() == torch::kFloat32,
                    "Input points must be float32");

        if (num_points <= 1) {
            return torch::full({num_points}, 0.01f, points.options());
        }

        const float* data = cpu_points.data_ptr<float>();

        gsf::core::PointCloudAdaptor cloud(data, static_cast<size_t>(num_points));
        gsf::core::KDTree index(3, cloud, nanoflann::KDTreeSingleIndexAdaptorParams(gsf::core::kKDTreeLeafSize));
        index.buildIndex();

        auto result = torch::zeros({num_points}, torch::kFloat32);
        float* result_data = result.data_ptr<float>();

        const size_t num_results = static_cast<size_t>(std::min<int64_t>(4, num_points));
        std::vector<size_t> ret_indices(num_results);
        std::vector<float> out_dists_sqr(num_results);

        for (int64_t i = 0; i < num_points; i++) {
            const float query_pt[3] = {data[i * 3 + 0], data[i * 3 + 1], data[i * 3 + 2]};

            nanoflann::KNNResultSet<float> resultSet(num_results);
            resultSet.init(&ret_indices[0], &out_dists_sqr[0]);
            index.findNeighbors(resultSet, &query_pt[0], nanoflann::SearchParameters(10));

            float sum_dist_sqr = 0.0f;
            int valid_neighbors = 0;

            // The query point itself comes back at distance zero
            for (size_t j = 0; j < resultSet.size() && valid_neighbors < 3; j++) {
                if (ret_indices[j] == static_cast<size_t>(i)) {
                    continue;
                }
                sum_dist_sqr += out_dists_sqr[j];
                valid_neighbors++;
            }

            result_data[i] = (valid_neighbors > 0) ? (sum_dist_sqr / valid_neighbors) : 0.01f;
        }

        return result.to(points.device());
    }

    gsf::PrimitiveType parse_primitive_type(const std::string& name) {
        return name == "generic" ? gsf::PrimitiveType::Generic : gsf::PrimitiveType::Surface;
    }
} // namespace

namespace gsf {

    const char* param_name(ParamId id) {
        switch (id) {
        case ParamId::Means: return "means";
        case ParamId::Sh0: return "sh0";
        case ParamId::ShN: return "shN";
        case ParamId::Scaling: return "scaling";
        case ParamId::Rotation: return "rotation";
        case ParamId::Opacity: return "opacity";
        }
        return "unknown";
    }

    torch::Tensor quat_to_rotmat(const torch::Tensor& quats) {
        auto quats_norm = torch::nn::functional::normalize(
            quats, torch::nn::functional::NormalizeFuncOptions().dim(-1).p(2));

        auto w = quats_norm.select(-1, 0);
        auto x = quats_norm.select(-1, 1);
        auto y = quats_norm.select(-1, 2);
        auto z = quats_norm.select(-1, 3);

        std::vector<torch::Tensor> R_components = {
            1 - 2 * (y * y + z * z),
            2 * (x * y - w * z),
            2 * (x * z + w * y),
            2 * (x * y + w * z),
            1 - 2 * (x * x + z * z),
            2 * (y * z - w * x),
            2 * (x * z - w * y),
            2 * (y * z + w * x),
            1 - 2 * (x * x + y * y)};

        auto R = torch::stack(R_components, -1);
        auto shape = quats.sizes().vec();
        shape.back() = 3;
        shape.push_back(3);
        return R.reshape(shape);
    }

    SplatData::SplatData(int sh_degree,
                         torch::Tensor means,
                         torch::Tensor sh0,
                         torch::Tensor shN,
                         torch::Tensor scaling,
                         torch::Tensor rotation,
                         torch::Tensor opacity,
                         torch::Tensor types,
                         float scene_scale)
        : _active_sh_degree{0},
          _max_sh_degree{sh_degree},
          _scene_scale{scene_scale},
          _means{std::move(means)},
          _sh0{std::move(sh0)},
          _shN{std::move(shN)},
          _scaling{std::move(scaling)},
          _rotation{std::move(rotation)},
          _opacity{std::move(opacity)},
          _types{std::move(types)} {

        const int64_t n = size();
        for (auto id : kAllParams) {
            const auto& p = param(id);
            if (!p.defined() || p.size(0) != n) {
                throw std::invalid_argument(std::format("SplatData: '{}' must have {} rows", param_name(id), n));
            }
        }
        if (!_types.defined() || _types.dim() != 1 || _types.size(0) != n) {
            throw std::invalid_argument(std::format("SplatData: 'types' must have shape [{}]", n));
        }
    }

    torch::Tensor SplatData::get_means() const {
        return _means;
    }

    torch::Tensor SplatData::get_opacity() const {
        return torch::sigmoid(_opacity).squeeze(-1);
    }

    torch::Tensor SplatData::get_rotation() const {
        return torch::nn::functional::normalize(_rotation,
                                                torch::nn::functional::NormalizeFuncOptions().dim(-1));
    }

    torch::Tensor SplatData::get_scaling() const {
        return torch::exp(_scaling);
    }

    torch::Tensor SplatData::get_shs() const {
        return torch::cat({_sh0, _shN}, 1);
    }

    torch::Tensor SplatData::get_normals() const {
        return quat_to_rotmat(_rotation).select(-1, 2);
    }

    torch::Tensor& SplatData::param(ParamId id) {
        switch (id) {
        case ParamId::Means: return _means;
        case ParamId::Sh0: return _sh0;
        case ParamId::ShN: return _shN;
        case ParamId::Scaling: return _scaling;
        case ParamId::Rotation: return _rotation;
        case ParamId::Opacity: return _opacity;
        }
        throw std::out_of_range("SplatData::param: unknown parameter id");
    }

    const torch::Tensor& SplatData::param(ParamId id) const {
        return const_cast<SplatData*>(this)->param(id);
    }

    int64_t SplatData::count(PrimitiveType type) const {
        if (size() == 0) {
            return 0;
        }
        return (_types == static_cast<int32_t>(type)).sum().item<int64_t>();
    }

    bool SplatData::increment_sh_degree() {
        if (_active_sh_degree < _max_sh_degree) {
            _active_sh_degree++;
            return true;
        }
        return false;
    }

    void SplatData::set_active_sh_degree(int sh_degree) {
        _active_sh_degree = std::clamp(sh_degree, 0, _max_sh_degree);
    }

    void SplatData::apply(const CompactionPlan& plan) {
        torch::NoGradGuard no_grad;

        const bool has_born = plan.num_born() > 0;
        const auto keep = plan.keep.to(_means.device());

        for (auto id : kAllParams) {
            auto& p = param(id);
            auto next = p.index_select(0, keep);
            if (has_born) {
                next = torch::cat({next, plan.born[to_index(id)].to(p.device(), p.scalar_type())}, 0);
            }
            p = next.contiguous().set_requires_grad(p.requires_grad());
        }

        auto next_types = _types.index_select(0, keep);
        if (has_born) {
            next_types = torch::cat({next_types, plan.born_types.to(_types.device(), _types.scalar_type())}, 0);
        }
        _types = next_types.contiguous();

        ++_generation;
    }

    void SplatData::replace(SplatData&& other) {
        const uint64_t next_generation = std::max(_generation, other._generation) + 1;
        *this = std::move(other);
        _generation = next_generation;
    }

    // Get attribute names for PLY format
    std::vector<std::string> SplatData::get_attribute_names() const {
        std::vector<std::string> a{"x", "y", "z", "nx", "ny", "nz"};

        for (int i = 0; i < _sh0.size(1) * _sh0.size(2); ++i)
            a.emplace_back("f_dc_" + std::to_string(i));
        for (int i = 0; i < _shN.size(1) * _shN.size(2); ++i)
            a.emplace_back("f_rest_" + std::to_string(i));

        a.emplace_back("opacity");

        for (int i = 0; i < _scaling.size(1); ++i)
            a.emplace_back("scale_" + std::to_string(i));
        for (int i = 0; i < _rotation.size(1); ++i)
            a.emplace_back("rot_" + std::to_string(i));

        return a;
    }

    void SplatData::save_ply(const std::filesystem::path& file_path) const {
        namespace fs = std::filesystem;
        torch::NoGradGuard no_grad;

        if (file_path.has_parent_path()) {
            fs::create_directories(file_path.parent_path());
        }

        const auto to_cpu = [](const torch::Tensor& t) {
            return t.detach().to(torch::kCPU, torch::kFloat32).contiguous();
        };

        // Same channel-major SH layout as the reference 3DGS exporter
        std::vector<torch::Tensor> tensors;
        tensors.push_back(to_cpu(_means));
        tensors.push_back(torch::zeros_like(tensors.front()));
        tensors.push_back(to_cpu(_sh0.transpose(1, 2).flatten(1)));
        if (_shN.size(1) > 0) {
            tensors.push_back(to_cpu(_shN.transpose(1, 2).flatten(1)));
        }
        tensors.push_back(to_cpu(_opacity));
        tensors.push_back(to_cpu(_scaling));
        tensors.push_back(to_cpu(get_rotation()));
        const auto types = _types.to(torch::kCPU, torch::kInt32).contiguous();

        const auto attr_names = get_attribute_names();
        const size_t count = static_cast<size_t>(size());

        tinyply::PlyFile ply;
        size_t attr_off = 0;
        for (const auto& tensor : tensors) {
            const size_t cols = tensor.size(1);
            std::vector<std::string> attrs(attr_names.begin() + attr_off,
                                           attr_names.begin() + attr_off + cols);

            ply.add_properties_to_element(
                "vertex",
                attrs,
                tinyply::Type::FLOAT32,
                count,
                reinterpret_cast<uint8_t*>(tensor.data_ptr<float>()),
                tinyply::Type::INVALID, 0);

            attr_off += cols;
        }
        ply.add_properties_to_element(
            "vertex",
            {"type"},
            tinyply::Type::INT32,
            count,
            reinterpret_cast<uint8_t*>(types.data_ptr<int32_t>()),
            tinyply::Type::INVALID, 0);

        std::filebuf fb;
        if (!fb.open(file_path, std::ios::out | std::ios::binary)) {
            throw std::runtime_error(std::format("Could not open {} for writing", file_path.string()));
        }
        std::ostream out_stream(&fb);
        ply.write(out_stream, /*binary=*/true);

        LOG_INFO("Saved {} primitives to {}", count, file_path.string());
    }

    std::expected<SplatData, std::string> SplatData::init_model_from_pointcloud(
        const param::TrainingParameters& params,
        const PointCloud& pcd,
        float scene_extent) {

        try {
            if (pcd.size() == 0) {
                return std::unexpected("Point cloud is empty");
            }

            const auto device = pcd.means.device();
            const auto f32 = torch::TensorOptions().dtype(torch::kFloat32).device(device);
            const auto& opt = params.optimization;

            auto rgb_to_sh = [](const torch::Tensor& rgb) {
                constexpr float kInvSH = 0.28209479177387814f;
                return (rgb - 0.5f) / kInvSH;
            };

            torch::Tensor colors = pcd.colors.defined()
                                       ? pcd.colors
                                       : torch::full({pcd.size(), 3}, 0.5f, f32);
            if (colors.dtype() == torch::kUInt8) {
                colors = colors.to(torch::kFloat32) / 255.0f;
            }

            // 1. means
            auto means = pcd.means.to(f32).clone().contiguous();
            const int64_t n = means.size(0);

            // 2. scaling (log of the RMS distance to the nearest neighbours)
            auto dist2 = torch::clamp_min(compute_mean_squared_neighbor_distances(means), 1e-7);
            auto scaling = torch::log(torch::sqrt(dist2))
                               .unsqueeze(-1)
                               .repeat({1, 3})
                               .to(f32);

            // 3. rotation (quaternion, identity)
            auto rotation = torch::zeros({n, 4}, f32);
            rotation.index_put_({torch::indexing::Slice(), 0}, 1);

            // 4. opacity (inverse sigmoid of init_opacity)
            auto opacity = torch::logit(opt.init_opacity * torch::ones({n, 1}, f32));

            // 5. shs (SH coefficients)
            auto fused_color = rgb_to_sh(colors.to(f32));
            const int64_t feature_shape = static_cast<int64_t>(std::pow(opt.sh_degree + 1, 2));
            auto sh0 = fused_color.unsqueeze(1).contiguous();             // [N, 1, 3]
            auto shN = torch::zeros({n, feature_shape - 1, 3}, f32);     // [N, K-1, 3]

            // 6. types
            torch::Tensor types;
            if (pcd.has_types()) {
                types = pcd.types.to(device, torch::kInt32).contiguous();
            } else {
                types = torch::full({n}, static_cast<int32_t>(parse_primitive_type(opt.init_primitive_type)),
                                    torch::TensorOptions().dtype(torch::kInt32).device(device));
            }

            LOG_INFO("Initialized SplatData with {} points (max SH degree {}, scene extent {:.4f})",
                     n, opt.sh_degree, scene_extent);
            LOG_DEBUG("  - sh0 shape: {}", tensor_sizes_to_string(sh0.sizes()));
            LOG_DEBUG("  - shN shape: {}", tensor_sizes_to_string(shN.sizes()));

            return SplatData(
                opt.sh_degree,
                means.set_requires_grad(true),
                sh0.set_requires_grad(true),
                shN.contiguous().set_requires_grad(true),
                scaling.contiguous().set_requires_grad(true),
                rotation.contiguous().set_requires_grad(true),
                opacity.contiguous().set_requires_grad(true),
                types,
                scene_extent);

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to initialize SplatData: {}", e.what()));
        }
    }
} // namespace gsf
