/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace gsf {
    namespace param {
        namespace {

            /**
             * @brief Read and parse a JSON configuration file
             * @param path Path to the JSON file
             * @return Expected JSON object or error message
             */
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Configuration file does not exist: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open configuration file: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parsing error in {}: {}", path.string(), e.what()));
                }
            }

            // Keys present in the file but unknown to OptimizationParameters are ignored with a warning
            void warn_unknown_parameters(const nlohmann::json& json) {
                const nlohmann::json known = OptimizationParameters{}.to_json();
                for (const auto& [key, value] : json.items()) {
                    if (!known.contains(key)) {
                        LOG_WARN("Unknown parameter '{}' in configuration (ignored)", key);
                    }
                }
            }

            template <typename T>
            void read_optional(const nlohmann::json& json, const char* key, std::optional<T>& out) {
                if (!json.contains(key)) {
                    return;
                }
                if (json[key].is_null()) {
                    out = std::nullopt;
                } else {
                    out = json[key].get<T>();
                }
            }

            template <typename T>
            nlohmann::json write_optional(const std::optional<T>& value) {
                return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
            }

            std::vector<size_t> read_steps(const nlohmann::json& json) {
                std::vector<size_t> steps;
                for (const auto& step : json) {
                    steps.push_back(step.get<size_t>());
                }
                return steps;
            }
        } // namespace

        nlohmann::json OptimizationParameters::to_json() const {

            nlohmann::json opt_json;
            opt_json["iterations"] = iterations;
            opt_json["sh_degree"] = sh_degree;
            opt_json["sh_degree_interval"] = sh_degree_interval;
            opt_json["position_lr_init"] = position_lr_init;
            opt_json["position_lr_final"] = position_lr_final;
            opt_json["position_lr_delay_mult"] = position_lr_delay_mult;
            opt_json["position_lr_delay_steps"] = position_lr_delay_steps;
            opt_json["position_lr_max_steps"] = position_lr_max_steps;
            opt_json["feature_lr"] = feature_lr;
            opt_json["opacity_lr"] = opacity_lr;
            opt_json["scaling_lr"] = scaling_lr;
            opt_json["rotation_lr"] = rotation_lr;
            opt_json["densify_from_iter"] = densify_from_iter;
            opt_json["densify_until_iter"] = densify_until_iter;
            opt_json["densification_interval"] = densification_interval;
            opt_json["densify_grad_threshold"] = write_optional(densify_grad_threshold);
            opt_json["percent_dense"] = write_optional(percent_dense);
            opt_json["split_scale_divisor"] = split_scale_divisor;
            opt_json["reset_stats_after_densify"] = reset_stats_after_densify;
            opt_json["min_opacity"] = min_opacity;
            opt_json["max_screen_size"] = max_screen_size;
            opt_json["size_threshold_from_iter"] = size_threshold_from_iter;
            opt_json["prune_scale3d"] = prune_scale3d;
            opt_json["max_population"] = write_optional(max_population);
            opt_json["opacity_reset_interval"] = opacity_reset_interval;
            opt_json["opacity_reset_value"] = opacity_reset_value;
            opt_json["white_background"] = white_background;
            opt_json["random_background"] = random_background;
            opt_json["knn_neighbors"] = knn_neighbors;
            opt_json["knn_refresh_interval"] = knn_refresh_interval;
            opt_json["lambda_pair_distance"] = lambda_pair_distance;
            opt_json["lambda_pair_normal"] = lambda_pair_normal;
            opt_json["init_opacity"] = init_opacity;
            opt_json["init_primitive_type"] = init_primitive_type;
            opt_json["test_iterations"] = test_iterations;
            opt_json["save_iterations"] = save_iterations;
            opt_json["checkpoint_iterations"] = checkpoint_iterations;
            opt_json["log_every"] = log_every;
            opt_json["telemetry"] = telemetry;
            opt_json["steps_scaler"] = steps_scaler;

            return opt_json;
        }

        OptimizationParameters OptimizationParameters::from_json(const nlohmann::json& json) {

            OptimizationParameters params;
            params.iterations = json.at("iterations").get<size_t>();
            params.densify_from_iter = json.at("densify_from_iter").get<size_t>();
            params.densify_until_iter = json.at("densify_until_iter").get<size_t>();
            params.densification_interval = json.at("densification_interval").get<size_t>();
            read_optional(json, "densify_grad_threshold", params.densify_grad_threshold);
            read_optional(json, "percent_dense", params.percent_dense);

            if (json.contains("sh_degree")) {
                params.sh_degree = json["sh_degree"];
            }
            if (json.contains("sh_degree_interval")) {
                params.sh_degree_interval = json["sh_degree_interval"];
            }
            if (json.contains("position_lr_init")) {
                params.position_lr_init = json["position_lr_init"];
            }
            if (json.contains("position_lr_final")) {
                params.position_lr_final = json["position_lr_final"];
            }
            if (json.contains("position_lr_delay_mult")) {
                params.position_lr_delay_mult = json["position_lr_delay_mult"];
            }
            if (json.contains("position_lr_delay_steps")) {
                params.position_lr_delay_steps = json["position_lr_delay_steps"];
            }
            if (json.contains("position_lr_max_steps")) {
                params.position_lr_max_steps = json["position_lr_max_steps"];
            }
            if (json.contains("feature_lr")) {
                params.feature_lr = json["feature_lr"];
            }
            if (json.contains("opacity_lr")) {
                params.opacity_lr = json["opacity_lr"];
            }
            if (json.contains("scaling_lr")) {
                params.scaling_lr = json["scaling_lr"];
            }
            if (json.contains("rotation_lr")) {
                params.rotation_lr = json["rotation_lr"];
            }
            if (json.contains("split_scale_divisor")) {
                params.split_scale_divisor = json["split_scale_divisor"];
            }
            if (json.contains("reset_stats_after_densify")) {
                params.reset_stats_after_densify = json["reset_stats_after_densify"];
            }
            if (json.contains("min_opacity")) {
                params.min_opacity = json["min_opacity"];
            }
            if (json.contains("max_screen_size")) {
                params.max_screen_size = json["max_screen_size"];
            }
            if (json.contains("size_threshold_from_iter")) {
                params.size_threshold_from_iter = json["size_threshold_from_iter"];
            }
            if (json.contains("prune_scale3d")) {
                params.prune_scale3d = json["prune_scale3d"];
            }
            read_optional(json, "max_population", params.max_population);
            if (json.contains("opacity_reset_interval")) {
                params.opacity_reset_interval = json["opacity_reset_interval"];
            }
            if (json.contains("opacity_reset_value")) {
                params.opacity_reset_value = json["opacity_reset_value"];
            }
            if (json.contains("white_background")) {
                params.white_background = json["white_background"];
            }
            if (json.contains("random_background")) {
                params.random_background = json["random_background"];
            }
            if (json.contains("knn_neighbors")) {
                params.knn_neighbors = json["knn_neighbors"];
            }
            if (json.contains("knn_refresh_interval")) {
                params.knn_refresh_interval = json["knn_refresh_interval"];
            }
            if (json.contains("lambda_pair_distance")) {
                params.lambda_pair_distance = json["lambda_pair_distance"];
            }
            if (json.contains("lambda_pair_normal")) {
                params.lambda_pair_normal = json["lambda_pair_normal"];
            }
            if (json.contains("init_opacity")) {
                params.init_opacity = json["init_opacity"];
            }

            if (json.contains("init_primitive_type")) {
                std::string type = json["init_primitive_type"];
                if (type == "surface" || type == "generic") {
                    params.init_primitive_type = type;
                } else {
                    LOG_WARN("Invalid init_primitive_type '{}' in JSON. Using default 'surface'", type);
                }
            }

            if (json.contains("telemetry")) {
                std::string telemetry = json["telemetry"];
                if (telemetry == "none" || telemetry == "local") {
                    params.telemetry = telemetry;
                } else {
                    LOG_WARN("Invalid telemetry backend '{}' in JSON. Using default 'none'", telemetry);
                }
            }

            if (json.contains("test_iterations")) {
                params.test_iterations = read_steps(json["test_iterations"]);
            }
            if (json.contains("save_iterations")) {
                params.save_iterations = read_steps(json["save_iterations"]);
            }
            if (json.contains("checkpoint_iterations")) {
                params.checkpoint_iterations = read_steps(json["checkpoint_iterations"]);
            }
            if (json.contains("log_every")) {
                params.log_every = json["log_every"];
            }
            if (json.contains("steps_scaler")) {
                params.steps_scaler = json["steps_scaler"];
            }

            return params;
        }

        /**
         * @brief Read optimization parameters from JSON file
         * @param[in] json file to load
         * @return Expected OptimizationParameters or error message
         */
        std::expected<OptimizationParameters, std::string> read_optim_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);

            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            auto json = *json_result;

            warn_unknown_parameters(json);

            try {
                OptimizationParameters params = OptimizationParameters::from_json(json);
                params.config_file = path.string();
                return params;

            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error parsing optimization parameters: {}", e.what()));
            }
        }

        std::expected<void, std::string> validate_parameters(const OptimizationParameters& params) {
            auto finite_positive = [](const std::optional<float>& v) {
                return v.has_value() && std::isfinite(*v) && *v > 0.f;
            };

            if (params.iterations == 0) {
                return std::unexpected("iterations must be positive");
            }
            if (!finite_positive(params.densify_grad_threshold)) {
                return std::unexpected("densify_grad_threshold must be a finite positive value");
            }
            if (!finite_positive(params.percent_dense)) {
                return std::unexpected("percent_dense must be a finite positive value");
            }
            // The position rate decays log-linearly, so both endpoints must be strictly positive
            if (!(std::isfinite(params.position_lr_init) && params.position_lr_init > 0.f)) {
                return std::unexpected(std::format("position_lr_init must be a finite positive value, got {}", params.position_lr_init));
            }
            if (!(std::isfinite(params.position_lr_final) && params.position_lr_final > 0.f)) {
                return std::unexpected(std::format("position_lr_final must be a finite positive value, got {}", params.position_lr_final));
            }
            if (params.densification_interval == 0) {
                return std::unexpected("densification_interval must be positive");
            }
            if (params.opacity_reset_interval == 0) {
                return std::unexpected("opacity_reset_interval must be positive");
            }
            if (params.sh_degree_interval == 0) {
                return std::unexpected("sh_degree_interval must be positive");
            }
            if (params.knn_refresh_interval == 0) {
                return std::unexpected("knn_refresh_interval must be positive");
            }
            if (params.densify_from_iter > params.densify_until_iter) {
                return std::unexpected(std::format("densify_from_iter ({}) must not exceed densify_until_iter ({})",
                                                   params.densify_from_iter, params.densify_until_iter));
            }
            if (params.sh_degree < 0 || params.sh_degree > 3) {
                return std::unexpected(std::format("sh_degree must be in [0, 3], got {}", params.sh_degree));
            }
            if (params.knn_neighbors <= 0) {
                return std::unexpected("knn_neighbors must be positive");
            }
            if (!(params.split_scale_divisor > 1.f)) {
                return std::unexpected("split_scale_divisor must be greater than 1");
            }
            if (params.min_opacity < 0.f || params.min_opacity >= 1.f) {
                return std::unexpected("min_opacity must be in [0, 1)");
            }
            if (params.opacity_reset_value <= 0.f || params.opacity_reset_value >= 1.f) {
                return std::unexpected("opacity_reset_value must be in (0, 1)");
            }
            if (params.init_opacity <= 0.f || params.init_opacity >= 1.f) {
                return std::unexpected("init_opacity must be in (0, 1)");
            }
            if (params.max_population && *params.max_population < 0) {
                return std::unexpected("max_population must not be negative");
            }
            if (params.log_every == 0) {
                return std::unexpected("log_every must be positive");
            }
            return {};
        }

        /**
         * @brief Save the effective training parameters to JSON
         * @param params The full training parameters
         * @param output_path Path to the output directory
         * @return Expected void or error message
         */
        std::expected<void, std::string> save_training_parameters_to_json(
            const TrainingParameters& params,
            const std::filesystem::path& output_path) {

            try {
                nlohmann::json json;

                json["optimization"] = params.optimization.to_json();
                json["output_path"] = params.output_path.string();
                if (params.start_checkpoint) {
                    json["start_checkpoint"] = params.start_checkpoint->string();
                }

                auto now = std::chrono::system_clock::now();
                auto time_t = std::chrono::system_clock::to_time_t(now);
                std::stringstream ss;
                ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
                json["timestamp"] = ss.str();

                std::filesystem::create_directories(output_path);
                std::filesystem::path filepath = output_path / "training_config.json";
                std::ofstream file(filepath);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open file for writing: {}", filepath.string()));
                }

                file << json.dump(4);
                file.close();

                LOG_INFO("Saved training configuration to: {}", filepath.string());
                return {};

            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving training parameters: {}", e.what()));
            }
        }
    } // namespace param
} // namespace gsf
