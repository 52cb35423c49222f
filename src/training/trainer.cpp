/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "trainer.hpp"
#include "checkpoint.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "losses/surface_alignment.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <format>

namespace gsf::training {

    torch::Tensor l1_photometric_loss(const RenderOutput& render_output, const torch::Tensor& gt_image) {
        TORCH_CHECK(render_output.image.sizes() == gt_image.sizes(),
                    "size mismatch: rendered ", render_output.image.sizes(),
                    " vs. ground truth ", gt_image.sizes());
        return torch::l1_loss(render_output.image, gt_image);
    }

    Trainer::Trainer(std::unique_ptr<PopulationManager> population,
                     std::shared_ptr<IRenderer> renderer,
                     std::shared_ptr<IViewSource> views,
                     ITelemetrySink& telemetry,
                     LossFn loss_fn)
        : population_(std::move(population)),
          renderer_(std::move(renderer)),
          views_(std::move(views)),
          telemetry_(telemetry),
          loss_fn_(std::move(loss_fn)) {
        if (!population_ || !renderer_ || !views_) {
            throw std::invalid_argument("Trainer requires a population, a renderer and a view source");
        }
        if (!loss_fn_) {
            loss_fn_ = l1_photometric_loss;
        }
        device_ = population_->splat_data().means().device();
    }

    std::expected<void, std::string> Trainer::initialize(const param::TrainingParameters& params) {
        LOG_INFO("Initializing trainer with {} iterations", params.optimization.iterations);

        try {
            if (auto valid = param::validate_parameters(params.optimization); !valid) {
                throw ConfigurationError(valid.error());
            }
            if (views_->train_views().empty()) {
                throw ConfigurationError("No training views available");
            }

            params_ = params;
            const auto& opt = params_.optimization;

            schedule_ = build_training_schedule(opt, make_actions());
            position_lr_ = ExponentialDecayLR::for_positions(opt, views_->scene_extent());
            sampler_.emplace(views_->train_views().size());
            graph_builder_ = NeighborGraphBuilder(opt.knn_neighbors);

            background_ = opt.white_background
                              ? torch::ones({3}, torch::TensorOptions().dtype(torch::kFloat32).device(device_))
                              : torch::zeros({3}, torch::TensorOptions().dtype(torch::kFloat32).device(device_));

            start_iteration_ = 0;
            if (params_.start_checkpoint) {
                auto checkpoint = load_checkpoint(*params_.start_checkpoint);
                if (!checkpoint) {
                    return std::unexpected(checkpoint.error());
                }
                start_iteration_ = static_cast<size_t>(population_->restore(std::move(*checkpoint)));
                LOG_INFO("Resuming from {} at iteration {}", params_.start_checkpoint->string(), start_iteration_);
            }
            current_iteration_ = start_iteration_;
            cum_created_ = 0;
            cum_deleted_ = 0;
            ema_loss_ = 0.f;

            graph_ = graph_builder_.rebuild(population_->splat_data());

            initialized_ = true;
            LOG_INFO("Trainer initialized: {} primitives, {} train views, {} test views, extent {:.3f}",
                     population_->size(),
                     views_->train_views().size(),
                     views_->test_views().size(),
                     views_->scene_extent());
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to initialize trainer: {}", e.what()));
        }
    }

    TrainingActions Trainer::make_actions() {
        TrainingActions actions;
        actions.escalate_sh_degree = [this](size_t iter) {
            if (population_->escalate_sh_degree()) {
                LOG_DEBUG("Iteration {}: SH degree raised to {}", iter,
                          population_->splat_data().get_active_sh_degree());
            }
        };
        actions.densify = [this](size_t iter, std::optional<float> size_threshold) {
            densify(iter, size_threshold);
        };
        actions.reset_opacity = [this](size_t iter) {
            population_->reset_opacity();
            LOG_DEBUG("Iteration {}: opacity reset", iter);
        };
        actions.refresh_graph = [this](size_t iter) { refresh_graph(iter); };
        actions.save = [this](size_t iter) { save_ply(iter); };
        actions.checkpoint = [this](size_t iter) { save_checkpoint(iter); };
        actions.evaluate = [this](size_t iter) { evaluate(iter); };
        return actions;
    }

    void Trainer::densify(size_t iter, std::optional<float> size_threshold) {
        const auto& opt = params_.optimization;
        const auto report = population_->densify_and_prune(opt.densify_grad_threshold,
                                                           opt.percent_dense,
                                                           views_->scene_extent(),
                                                           size_threshold,
                                                           opt.max_population);
        cum_created_ += report.created;
        cum_deleted_ += report.deleted;

        LOG_DEBUG("Iteration {}: densified {} -> {} (cloned {}, split {}, pruned {}, capped {})",
                  iter, report.size_before, report.size_after,
                  report.num_cloned, report.num_split, report.num_pruned, report.num_capped);

        refresh_graph(iter);
    }

    void Trainer::refresh_graph(size_t iter) {
        graph_ = graph_builder_.rebuild(population_->splat_data());
        LOG_TRACE("Iteration {}: neighbour graph rebuilt", iter);
    }

    void Trainer::save_ply(size_t iter) {
        const auto path = params_.output_path / "point_cloud" / std::format("iteration_{}", iter) / "point_cloud.ply";
        population_->splat_data().save_ply(path);
        LOG_INFO("Iteration {}: saved {} primitives to {}", iter, population_->size(), path.string());
    }

    void Trainer::save_checkpoint(size_t iter) {
        const auto path = params_.output_path / std::format("chkpnt{}.pt", iter);
        if (auto result = training::save_checkpoint(population_->capture(static_cast<int64_t>(iter)), path); !result) {
            throw std::runtime_error(result.error());
        }
        LOG_INFO("Iteration {}: checkpoint written to {}", iter, path.string());
    }

    torch::Tensor Trainer::background_for_step() {
        if (params_.optimization.random_background) {
            return torch::rand({3}, torch::TensorOptions().dtype(torch::kFloat32).device(device_));
        }
        return background_;
    }

    void Trainer::train_step(size_t iter) {
        const auto& opt = params_.optimization;
        const auto t_start = std::chrono::steady_clock::now();

        current_iteration_ = iter;
        population_->set_position_lr((*position_lr_)(iter));

        schedule_.pre_render.run(iter);

        const auto& view = views_->train_views()[sampler_->next()];
        const auto gt_image = view.image.to(device_);
        auto bg = background_for_step();

        RenderOutput r_output = renderer_->render(population_->splat_data(), view.camera, bg);
        if (r_output.means2d.defined() && r_output.means2d.requires_grad() && !r_output.means2d.is_leaf()) {
            r_output.means2d.retain_grad();
        }

        torch::Tensor photometric = loss_fn_(r_output, gt_image);
        torch::Tensor loss = photometric;

        if (graph_.is_valid_for(population_->splat_data()) &&
            (opt.lambda_pair_distance > 0.f || opt.lambda_pair_normal > 0.f)) {
            const int64_t n = population_->size();
            torch::Tensor rows_mask = r_output.visibility.defined()
                                          ? r_output.visibility.reshape({-1, n}).any(0)
                                          : torch::ones({n}, torch::TensorOptions().dtype(torch::kBool).device(device_));
            if (auto terms = losses::surface_alignment_loss(population_->splat_data(), graph_, rows_mask)) {
                loss = loss + opt.lambda_pair_distance * terms->distance + opt.lambda_pair_normal * terms->normal;
            }
        }

        loss.backward();
        const float loss_value = loss.item<float>();

        if (!std::isfinite(loss_value)) {
            throw std::runtime_error(std::format("Loss became {} at iteration {}", loss_value, iter));
        }

        // Statistics only feed densification
        if (iter < opt.densify_until_iter) {
            population_->update_stats(r_output);
        }

        {
            torch::NoGradGuard no_grad;

            schedule_.post_backward.run(iter);

            if (iter < opt.iterations) {
                population_->step();
            } else {
                population_->zero_grad();
            }

            schedule_.post_step.run(iter);

            const auto t_end = std::chrono::steady_clock::now();
            const double iter_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

            ema_loss_ = 0.4f * loss_value + 0.6f * ema_loss_;
            if (iter % opt.log_every == 0) {
                LOG_INFO("Iteration {}/{} [{}] loss {:.4f} primitives {}",
                         iter, opt.iterations, phase_name(phase_at(opt, iter)), ema_loss_, population_->size());
            }

            const auto i = static_cast<int64_t>(iter);
            const double l1 = (r_output.image.detach() - gt_image).abs().mean().item<double>();
            telemetry_.log_scalar("train/l1_loss", l1, i);
            telemetry_.log_scalar("train/total_loss", loss_value, i);
            if (r_output.depth_loss.defined()) {
                telemetry_.log_scalar("train/depth_loss", r_output.depth_loss.mean().item<double>(), i);
            }
            telemetry_.log_scalar("iter_time", iter_ms, i);
            telemetry_.log_scalar("n_gaussians", static_cast<double>(population_->size()), i);
            telemetry_.log_scalar("cum_created", static_cast<double>(cum_created_), i);
            telemetry_.log_scalar("cum_deleted", static_cast<double>(cum_deleted_), i);
        }
    }

    std::expected<void, std::string> Trainer::train(std::stop_token stop_token) {
        if (!initialized_) {
            return std::unexpected("Trainer not initialized");
        }

        const auto& opt = params_.optimization;
        LOG_INFO("Starting training from iteration {} to {}", start_iteration_ + 1, opt.iterations);

        try {
            size_t iter = start_iteration_ + 1;
            while (iter <= opt.iterations) {
                if (stop_token.stop_requested()) {
                    LOG_WARN("Training stopped at iteration {}", current_iteration_);
                    break;
                }
                train_step(iter);
                ++iter;
            }

            // The final iteration's save task already ran inside the loop
            if (current_iteration_ != opt.iterations) {
                save_ply(current_iteration_);
            }
            telemetry_.flush();

            LOG_INFO("Training finished at iteration {} with {} primitives", current_iteration_, population_->size());
            return {};
        } catch (const std::exception& e) {
            telemetry_.flush();
            return std::unexpected(std::format("Training failed at iteration {}: {}", current_iteration_, e.what()));
        }
    }

    std::vector<EvaluationResult> Trainer::evaluate(size_t iteration) {
        torch::NoGradGuard no_grad;

        const auto& train = views_->train_views();
        // Every 5th training view, each at most once
        std::vector<const TrainingView*> train_subset;
        for (size_t idx = 0; idx < train.size(); idx += 5) {
            train_subset.push_back(&train[idx]);
        }
        std::vector<const TrainingView*> test_subset;
        for (const auto& view : views_->test_views()) {
            test_subset.push_back(&view);
        }

        std::vector<EvaluationResult> results;
        for (const auto& [split, subset] : {std::pair{"test", &test_subset}, std::pair{"train", &train_subset}}) {
            if (subset->empty()) {
                continue;
            }

            EvaluationResult result{split, subset->size(), 0.0, 0.0};
            for (const auto* view : *subset) {
                const auto gt = view->image.to(device_);
                const auto image = renderer_->render(population_->splat_data(), view->camera, background_)
                                       .image.clamp(0.0, 1.0);
                const auto mse = (image - gt).pow(2).mean().item<double>();
                result.l1 += (image - gt).abs().mean().item<double>();
                result.psnr += 20.0 * std::log10(1.0 / std::sqrt(std::max(mse, 1e-10)));
            }
            result.l1 /= static_cast<double>(subset->size());
            result.psnr /= static_cast<double>(subset->size());

            LOG_INFO("[ITER {}] Evaluating {}: L1 {:.6f} PSNR {:.3f}", iteration, split, result.l1, result.psnr);
            telemetry_.log_scalar(std::format("{}/l1_loss", split), result.l1, static_cast<int64_t>(iteration));
            telemetry_.log_scalar(std::format("{}/psnr", split), result.psnr, static_cast<int64_t>(iteration));
            results.push_back(std::move(result));
        }
        return results;
    }
} // namespace gsf::training
