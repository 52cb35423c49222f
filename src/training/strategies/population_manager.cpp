/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "population_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <format>
#include <vector>

namespace gsf::training {

    namespace {
        torch::Device device_of(const SplatData& splat_data) {
            return splat_data.means().defined() ? splat_data.means().device() : torch::Device(torch::kCPU);
        }

        torch::Tensor repeat_rows(const torch::Tensor& t, int64_t times) {
            std::vector<int64_t> repeats(t.dim(), 1);
            repeats[0] = times;
            return t.repeat(repeats);
        }
    } // namespace

    std::array<PopulationAdam::Options, kParamCount> make_adam_options(const param::OptimizationParameters& params,
                                                                       float scene_extent) {
        std::array<PopulationAdam::Options, kParamCount> options;
        options[to_index(ParamId::Means)] = PopulationAdam::Options(params.position_lr_init * scene_extent);
        options[to_index(ParamId::Sh0)] = PopulationAdam::Options(params.feature_lr);
        options[to_index(ParamId::ShN)] = PopulationAdam::Options(params.feature_lr / 20.0);
        options[to_index(ParamId::Scaling)] = PopulationAdam::Options(params.scaling_lr);
        options[to_index(ParamId::Rotation)] = PopulationAdam::Options(params.rotation_lr);
        options[to_index(ParamId::Opacity)] = PopulationAdam::Options(params.opacity_lr);
        return options;
    }

    PopulationManager::PopulationManager(SplatData&& splat_data, const param::OptimizationParameters& params)
        : _params(params),
          _splat_data(std::move(splat_data)),
          _stats(_splat_data.size(), device_of(_splat_data)),
          _optimizer(_splat_data, make_adam_options(params, _splat_data.get_scene_scale())) {
    }

    DensifyReport PopulationManager::densify_and_prune(std::optional<float> grad_threshold,
                                                       std::optional<float> percent_dense,
                                                       float scene_extent,
                                                       std::optional<float> size_threshold,
                                                       std::optional<int64_t> max_population) {
        if (!grad_threshold || !std::isfinite(*grad_threshold)) {
            throw ConfigurationError("densify_and_prune: gradient threshold is not defined");
        }
        if (!percent_dense || !std::isfinite(*percent_dense)) {
            throw ConfigurationError("densify_and_prune: percent_dense is not defined");
        }

        DensifyReport report;
        const int64_t n = _splat_data.size();
        report.size_before = n;
        report.size_after_growth = n;
        report.size_after = n;
        if (n == 0) {
            LOG_DEBUG("densify_and_prune on an empty population, nothing to do");
            return report;
        }
        if (_stats.size() != n || _optimizer.size() != n) {
            throw std::runtime_error(std::format("Population out of sync: {} primitives, {} stats rows, {} optimizer rows",
                                                 n, _stats.size(), _optimizer.size()));
        }

        torch::NoGradGuard no_grad;

        const auto device = device_of(_splat_data);
        const auto i64 = torch::TensorOptions().dtype(torch::kInt64).device(device);
        const auto bool_opts = torch::TensorOptions().dtype(torch::kBool).device(device);

        // 1. candidates
        const torch::Tensor grads = _stats.average_grad();
        const torch::Tensor scales = _splat_data.get_scaling();
        const torch::Tensor max_scale = std::get<0>(torch::max(scales, -1));
        const torch::Tensor is_candidate = grads >= *grad_threshold;
        const torch::Tensor is_small = max_scale <= *percent_dense * scene_extent;

        // 2./3. clone small, split large
        const torch::Tensor clone_idxs = (is_candidate & is_small).nonzero().squeeze(-1);
        const torch::Tensor is_split = is_candidate & is_small.logical_not();
        const torch::Tensor split_idxs = is_split.nonzero().squeeze(-1);
        const int64_t num_clone = clone_idxs.size(0);
        const int64_t num_split = split_idxs.size(0);
        constexpr int64_t split_size = 2;
        const int64_t num_born = num_clone + split_size * num_split;

        torch::Tensor split_samples;
        if (num_split > 0) {
            const torch::Tensor sampled_scales = scales.index_select(0, split_idxs);
            const torch::Tensor rotmats = quat_to_rotmat(_splat_data.rotation_raw().index_select(0, split_idxs)); // [S, 3, 3]
            split_samples = torch::einsum( // [split_size, S, 3]
                "nij,nj,bnj->bni",
                {rotmats,
                 sampled_scales,
                 torch::randn({split_size, num_split, 3}, sampled_scales.options())});
        }

        const auto param_fn = [&](const ParamId id) {
            const torch::Tensor& param = _splat_data.param(id);
            const torch::Tensor cloned = param.index_select(0, clone_idxs);
            if (num_split == 0) {
                return cloned;
            }

            const torch::Tensor sampled = param.index_select(0, split_idxs);
            torch::Tensor split_param;
            if (id == ParamId::Means) {
                split_param = (sampled.unsqueeze(0) + split_samples).reshape({-1, 3}); // [split_size * S, 3]
            } else if (id == ParamId::Scaling) {
                split_param = repeat_rows(sampled - std::log(_params.split_scale_divisor), split_size);
            } else {
                split_param = repeat_rows(sampled, split_size);
            }
            return torch::cat({cloned, split_param}, 0);
        };

        std::array<torch::Tensor, kParamCount> born;
        for (auto id : kAllParams) {
            born[to_index(id)] = param_fn(id);
        }
        torch::Tensor born_types = torch::cat({_splat_data.types().index_select(0, clone_idxs),
                                               repeat_rows(_splat_data.types().index_select(0, split_idxs), split_size)});
        torch::Tensor parents = torch::cat({clone_idxs, repeat_rows(split_idxs, split_size)});
        torch::Tensor warm_start = torch::cat({torch::ones({num_clone}, bool_opts),
                                               torch::zeros({split_size * num_split}, bool_opts)});

        report.num_cloned = num_clone;
        report.num_split = num_split;
        report.created = num_born;
        report.size_after_growth = n - num_split + num_born;

        // 4. prune over the post-growth population [old rows..., newborns...]
        const torch::Tensor alive = torch::cat({is_split.logical_not(), torch::ones({num_born}, bool_opts)});
        const torch::Tensor opacity = torch::cat({_splat_data.get_opacity(),
                                                  torch::sigmoid(born[to_index(ParamId::Opacity)]).reshape({-1})});
        torch::Tensor is_prune = opacity < _params.min_opacity;
        if (size_threshold) {
            const torch::Tensor radii = torch::cat({_stats.max_radii(),
                                                    torch::zeros({num_born}, _stats.max_radii().options())});
            const torch::Tensor all_max_scale = torch::cat({max_scale,
                                                            std::get<0>(torch::max(torch::exp(born[to_index(ParamId::Scaling)]), -1))});
            is_prune |= radii > *size_threshold;
            is_prune |= all_max_scale > _params.prune_scale3d * scene_extent;
        }
        is_prune &= alive;
        report.num_pruned = is_prune.sum().item<int64_t>();
        torch::Tensor survive = alive & is_prune.logical_not();

        // 5. cap
        if (max_population) {
            const int64_t num_survivors = survive.sum().item<int64_t>();
            const int64_t excess = num_survivors - *max_population;
            if (excess > 0) {
                const torch::Tensor survivor_idxs = survive.nonzero().squeeze(-1);
                const torch::Tensor lowest = std::get<1>(torch::topk(opacity.index_select(0, survivor_idxs),
                                                                     excess, /*dim=*/0, /*largest=*/false));
                survive.index_put_({survivor_idxs.index_select(0, lowest)}, false);
                report.num_capped = excess;
                LOG_DEBUG("Population cap {} reached, removing {} least opaque primitives", *max_population, excess);
            }
        }

        report.deleted = num_split + report.num_pruned + report.num_capped;

        // 6. compaction
        const torch::Tensor survive_old = survive.slice(0, 0, n);
        const torch::Tensor survive_born = survive.slice(0, n);
        const bool unchanged = num_born == 0 && survive_old.all().item<bool>();

        if (!unchanged) {
            CompactionPlan plan;
            plan.keep = survive_old.nonzero().squeeze(-1);
            const torch::Tensor born_keep = survive_born.nonzero().squeeze(-1);
            plan.parents = parents.index_select(0, born_keep).to(i64);
            plan.warm_start = warm_start.index_select(0, born_keep);
            for (auto id : kAllParams) {
                plan.born[to_index(id)] = born[to_index(id)].index_select(0, born_keep);
            }
            plan.born_types = born_types.index_select(0, born_keep);

            _splat_data.apply(plan);
            _stats.apply(plan);
            _optimizer.apply(plan);
        }

        if (_params.reset_stats_after_densify) {
            _stats.reset();
        }

        report.size_after = _splat_data.size();
        return report;
    }

    void PopulationManager::reset_opacity() {
        torch::NoGradGuard no_grad;

        const double floor = _params.opacity_reset_value;
        const float floor_logit = static_cast<float>(std::log(floor / (1.0 - floor)));
        _splat_data.opacity_raw().clamp_max_(floor_logit);
    }

    bool PopulationManager::escalate_sh_degree() {
        return _splat_data.increment_sh_degree();
    }

    void PopulationManager::update_stats(const RenderOutput& render_output) {
        torch::Tensor grad;
        if (render_output.means2d.defined()) {
            grad = render_output.means2d.grad();
        }
        _stats.update(grad, render_output.visibility, render_output.radii);
    }

    void PopulationManager::step() {
        _optimizer.step(_splat_data);
        _optimizer.zero_grad(_splat_data);
    }

    void PopulationManager::zero_grad() {
        _optimizer.zero_grad(_splat_data);
    }

    Checkpoint PopulationManager::capture(int64_t iteration) const {
        torch::NoGradGuard no_grad;

        Checkpoint checkpoint;
        checkpoint.iteration = iteration;
        checkpoint.active_sh_degree = _splat_data.get_active_sh_degree();
        checkpoint.max_sh_degree = _splat_data.get_max_sh_degree();
        checkpoint.scene_scale = _splat_data.get_scene_scale();
        for (auto id : kAllParams) {
            checkpoint.params[to_index(id)] = _splat_data.param(id).detach().clone();

            const auto& state = _optimizer.state(id);
            auto& saved = checkpoint.optimizer[to_index(id)];
            saved.exp_avg = state.exp_avg.clone();
            saved.exp_avg_sq = state.exp_avg_sq.clone();
            saved.step_count = state.step_count;
        }
        checkpoint.types = _splat_data.types().clone();
        return checkpoint;
    }

    int64_t PopulationManager::restore(Checkpoint&& checkpoint) {
        if (checkpoint.max_sh_degree != _params.sh_degree) {
            throw CheckpointFormatError(std::format("Checkpoint does not match the configured model: SH degree {} vs configured {}",
                                                    checkpoint.max_sh_degree, _params.sh_degree));
        }

        const int64_t n = checkpoint.size();
        const auto device = device_of(_splat_data);
        SplatData restored = make_splat_data(checkpoint, device, /*requires_grad=*/true);

        for (auto& state : checkpoint.optimizer) {
            state.exp_avg = state.exp_avg.detach().to(device, torch::kFloat32).contiguous();
            state.exp_avg_sq = state.exp_avg_sq.detach().to(device, torch::kFloat32).contiguous();
        }

        _splat_data.replace(std::move(restored));
        _stats = DensificationStats(n, device);
        _optimizer.load_states(std::move(checkpoint.optimizer));

        LOG_INFO("Restored {} primitives at iteration {}", n, checkpoint.iteration);
        return checkpoint.iteration;
    }
} // namespace gsf::training
