/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include <format>
#include <vector>

namespace gsf::training {

    namespace {
        std::string param_key(const char* group, ParamId id, const char* field = nullptr) {
            return field ? std::format("{}/{}/{}", group, param_name(id), field)
                         : std::format("{}/{}", group, param_name(id));
        }

        int64_t read_int(torch::serialize::InputArchive& archive, const std::string& key) {
            c10::IValue value;
            archive.read(key, value);
            return value.toInt();
        }

        double read_double(torch::serialize::InputArchive& archive, const std::string& key) {
            c10::IValue value;
            archive.read(key, value);
            return value.toDouble();
        }

        std::string shape_str(const torch::Tensor& t) {
            if (!t.defined()) {
                return "undefined";
            }
            std::string s = "[";
            for (int64_t i = 0; i < t.dim(); ++i) {
                s += (i ? ", " : "") + std::to_string(t.size(i));
            }
            return s + "]";
        }
    } // namespace

    void validate_checkpoint(const Checkpoint& checkpoint) {
        const auto fail = [](const std::string& what) {
            throw CheckpointFormatError("Malformed checkpoint: " + what);
        };

        if (checkpoint.max_sh_degree < 0 || checkpoint.max_sh_degree > 3) {
            fail(std::format("SH degree {} out of range", checkpoint.max_sh_degree));
        }
        if (checkpoint.active_sh_degree < 0 || checkpoint.active_sh_degree > checkpoint.max_sh_degree) {
            fail(std::format("active SH degree {} exceeds {}", checkpoint.active_sh_degree, checkpoint.max_sh_degree));
        }

        const int64_t n = checkpoint.size();
        const int64_t sh_rest = (checkpoint.max_sh_degree + 1) * (checkpoint.max_sh_degree + 1) - 1;
        const std::array<std::vector<int64_t>, kParamCount> expected_shapes = {
            std::vector<int64_t>{n, 3},
            std::vector<int64_t>{n, 1, 3},
            std::vector<int64_t>{n, sh_rest, 3},
            std::vector<int64_t>{n, 3},
            std::vector<int64_t>{n, 4},
            std::vector<int64_t>{n, 1}};

        for (auto id : kAllParams) {
            const auto& param = checkpoint.params[to_index(id)];
            const auto& expected = expected_shapes[to_index(id)];
            if (!param.defined() || param.sizes().vec() != expected) {
                fail(std::format("'{}' has shape {}", param_name(id), shape_str(param)));
            }
            const auto& state = checkpoint.optimizer[to_index(id)];
            if (!state.exp_avg.defined() || state.exp_avg.sizes().vec() != expected ||
                !state.exp_avg_sq.defined() || state.exp_avg_sq.sizes().vec() != expected) {
                fail(std::format("optimizer state of '{}' has shape {} / {}", param_name(id),
                                 shape_str(state.exp_avg), shape_str(state.exp_avg_sq)));
            }
        }
        if (!checkpoint.types.defined() || checkpoint.types.sizes().vec() != std::vector<int64_t>{n}) {
            fail(std::format("'types' has shape {}", shape_str(checkpoint.types)));
        }
    }

    SplatData make_splat_data(const Checkpoint& checkpoint, const torch::Device& device, bool requires_grad) {
        validate_checkpoint(checkpoint);

        const auto to_param = [&](ParamId id) {
            return checkpoint.params[to_index(id)].detach().to(device, torch::kFloat32).contiguous().set_requires_grad(requires_grad);
        };

        SplatData splat_data(checkpoint.max_sh_degree,
                             to_param(ParamId::Means),
                             to_param(ParamId::Sh0),
                             to_param(ParamId::ShN),
                             to_param(ParamId::Scaling),
                             to_param(ParamId::Rotation),
                             to_param(ParamId::Opacity),
                             checkpoint.types.to(device, torch::kInt32).contiguous(),
                             checkpoint.scene_scale);
        splat_data.set_active_sh_degree(checkpoint.active_sh_degree);
        return splat_data;
    }

    CheckpointSummary summarize_checkpoint(const Checkpoint& checkpoint) {
        torch::NoGradGuard no_grad;

        CheckpointSummary summary;
        summary.iteration = checkpoint.iteration;
        summary.size = checkpoint.size();
        summary.active_sh_degree = checkpoint.active_sh_degree;
        summary.max_sh_degree = checkpoint.max_sh_degree;
        summary.scene_scale = checkpoint.scene_scale;
        summary.optimizer_steps = checkpoint.optimizer[to_index(ParamId::Means)].step_count;

        if (summary.size > 0) {
            const auto types = checkpoint.types.to(torch::kInt32);
            summary.num_surface = (types == static_cast<int32_t>(PrimitiveType::Surface)).sum().item<int64_t>();
            summary.num_generic = (types == static_cast<int32_t>(PrimitiveType::Generic)).sum().item<int64_t>();

            const auto opacity = torch::sigmoid(checkpoint.params[to_index(ParamId::Opacity)].to(torch::kFloat32));
            summary.opacity_min = opacity.min().item<float>();
            summary.opacity_mean = opacity.mean().item<float>();
            summary.opacity_max = opacity.max().item<float>();
        }
        return summary;
    }

    std::expected<void, std::string> save_checkpoint(const Checkpoint& checkpoint,
                                                     const std::filesystem::path& path) {
        try {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }

            torch::serialize::OutputArchive archive;
            archive.write("header/magic", c10::IValue(CHECKPOINT_MAGIC));
            archive.write("header/version", c10::IValue(CHECKPOINT_VERSION));

            archive.write("state/iteration", c10::IValue(checkpoint.iteration));
            archive.write("state/active_sh_degree", c10::IValue(static_cast<int64_t>(checkpoint.active_sh_degree)));
            archive.write("state/max_sh_degree", c10::IValue(static_cast<int64_t>(checkpoint.max_sh_degree)));
            archive.write("state/scene_scale", c10::IValue(static_cast<double>(checkpoint.scene_scale)));

            for (auto id : kAllParams) {
                archive.write(param_key("splat", id), checkpoint.params[to_index(id)].cpu());

                const auto& state = checkpoint.optimizer[to_index(id)];
                archive.write(param_key("adam", id, "exp_avg"), state.exp_avg.cpu());
                archive.write(param_key("adam", id, "exp_avg_sq"), state.exp_avg_sq.cpu());
                archive.write(param_key("adam", id, "step"), c10::IValue(state.step_count));
            }
            archive.write("splat/types", checkpoint.types.cpu());

            archive.save_to(path.string());

            LOG_INFO("Checkpoint saved: {} ({} primitives, iter {})",
                     path.string(), checkpoint.size(), checkpoint.iteration);
            return {};

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Save checkpoint failed: ") + e.what());
        }
    }

    std::expected<Checkpoint, std::string> load_checkpoint(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return std::unexpected("Checkpoint does not exist: " + path.string());
        }

        try {
            torch::serialize::InputArchive archive;
            archive.load_from(path.string());

            if (read_int(archive, "header/magic") != CHECKPOINT_MAGIC) {
                return std::unexpected("Invalid checkpoint: wrong magic");
            }
            const int64_t version = read_int(archive, "header/version");
            if (version > CHECKPOINT_VERSION) {
                return std::unexpected("Unsupported version: " + std::to_string(version));
            }

            Checkpoint checkpoint;
            checkpoint.iteration = read_int(archive, "state/iteration");
            checkpoint.active_sh_degree = static_cast<int>(read_int(archive, "state/active_sh_degree"));
            checkpoint.max_sh_degree = static_cast<int>(read_int(archive, "state/max_sh_degree"));
            checkpoint.scene_scale = static_cast<float>(read_double(archive, "state/scene_scale"));

            for (auto id : kAllParams) {
                archive.read(param_key("splat", id), checkpoint.params[to_index(id)]);

                auto& state = checkpoint.optimizer[to_index(id)];
                archive.read(param_key("adam", id, "exp_avg"), state.exp_avg);
                archive.read(param_key("adam", id, "exp_avg_sq"), state.exp_avg_sq);
                state.step_count = read_int(archive, param_key("adam", id, "step"));
            }
            archive.read("splat/types", checkpoint.types);

            LOG_INFO("Checkpoint loaded: {} ({} primitives, iter {})",
                     path.string(), checkpoint.size(), checkpoint.iteration);
            return checkpoint;

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Load checkpoint failed: ") + e.what());
        }
    }

} // namespace gsf::training
