/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <args.hxx>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <print>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

    /**
     * @brief Get the path to a configuration file
     * @param filename Name of the configuration file
     * @return std::filesystem::path Full path to the configuration file
     */
    std::filesystem::path get_config_path(const std::string& filename) {
        std::error_code ec;
        std::filesystem::path executablePath = std::filesystem::canonical("/proc/self/exe", ec);
        if (ec) {
            return std::filesystem::path("parameter") / filename;
        }
        std::filesystem::path searchDir = executablePath.parent_path();
        while (!searchDir.empty() && !std::filesystem::exists(searchDir / "parameter" / filename)) {
            auto parent = searchDir.parent_path();
            if (parent == searchDir) { // when we reach a folder which is parentless - its parent is itself
                break;
            }
            searchDir = parent;
        }
        return searchDir / "parameter" / filename;
    }

    enum class ParseResult {
        Success,
        Help
    };

    void scale_steps_vector(std::vector<size_t>& steps, size_t scaler) {
        std::set<size_t> unique_steps;
        for (const auto& step : steps) {
            unique_steps.insert(step * scaler);
        }
        steps.assign(unique_steps.begin(), unique_steps.end());
    }

    // "<module>=<level>", e.g. "training=debug"
    std::expected<std::pair<gsf::core::LogModule, gsf::core::LogLevel>, std::string> parse_module_level(const std::string& assignment) {
        const auto eq = assignment.find('=');
        if (eq == std::string::npos) {
            return std::unexpected(std::format("ERROR: --log-module expects <module>=<level>, got '{}'", assignment));
        }
        const auto module = gsf::core::parse_log_module(assignment.substr(0, eq));
        if (!module) {
            return std::unexpected(std::format("ERROR: unknown log module '{}' (core, training, checkpoint, telemetry, cli)",
                                               assignment.substr(0, eq)));
        }
        const auto level = gsf::core::parse_log_level(assignment.substr(eq + 1));
        if (!level) {
            return std::unexpected(std::format("ERROR: unknown log level '{}'", assignment.substr(eq + 1)));
        }
        return std::make_pair(*module, *level);
    }

    std::expected<std::tuple<ParseResult, std::function<void()>>, std::string> parse_arguments(
        const std::vector<std::string>& args,
        gsf::args::CommandLine& cmd) {

        try {
            ::args::ArgumentParser parser(
                "GSForge: densification, pruning and scheduling core of a Gaussian splatting trainer.\n",
                "Usage:\n"
                "  Plan:    gsforge plan [--config <file>] [options]\n"
                "  Init:    gsforge init <seed.ply> -o <output_dir> [--config <file>] [--scene-extent <e>]\n"
                "  Inspect: gsforge inspect <checkpoint>\n"
                "  Export:  gsforge export <checkpoint> -o <file.ply>\n");

            ::args::Group commands(parser, "commands");
            ::args::Command plan(commands, "plan", "Print phase boundaries and every scheduled task of a configuration");
            ::args::Command init(commands, "init", "Seed a population from a point cloud and write the starting checkpoint");
            ::args::Command inspect(commands, "inspect", "Summarise a training checkpoint");
            ::args::Command export_ply(commands, "export", "Write the population of a checkpoint as PLY");

            ::args::Group arguments(parser, "arguments", ::args::Group::Validators::DontCare, ::args::Options::Global);
            ::args::HelpFlag help(arguments, "help", "Display help menu", {'h', "help"});
            ::args::CompletionFlag completion(parser, {"complete"});

            // Logging options
            ::args::ValueFlag<std::string> log_level(arguments, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(arguments, "file", "Optional log file path", {"log-file"});
            ::args::ValueFlagList<std::string> log_modules(arguments, "module=level", "Per-module log level, repeatable (modules: core, training, checkpoint, telemetry, cli)", {"log-module"});

            // plan
            ::args::ValueFlag<std::string> config_file(plan, "config_file", "GSForge config file (json)", {"config"});
            ::args::ValueFlag<size_t> iterations(plan, "iterations", "Number of iterations", {'i', "iter"});
            ::args::ValueFlag<float> steps_scaler(plan, "steps_scaler", "Scale training steps by factor", {"steps-scaler"});
            ::args::ValueFlag<int> sh_degree(plan, "sh_degree", "Max SH degree [0-3]", {"sh-degree"});
            ::args::ValueFlag<size_t> sh_degree_interval(plan, "sh_degree_interval", "SH degree interval", {"sh-degree-interval"});
            ::args::ValueFlag<size_t> densify_from(plan, "densify_from", "First densification iteration", {"densify-from"});
            ::args::ValueFlag<size_t> densify_until(plan, "densify_until", "End of the densification window (exclusive)", {"densify-until"});
            ::args::ValueFlag<size_t> densify_every(plan, "densify_every", "Densification interval", {"densify-every"});
            ::args::ValueFlag<size_t> opacity_reset_every(plan, "opacity_reset_every", "Opacity reset interval", {"opacity-reset-every"});
            ::args::ValueFlag<size_t> knn_refresh_every(plan, "knn_refresh_every", "Neighbour graph refresh interval after densification", {"knn-refresh-every"});
            ::args::ValueFlag<int64_t> max_population(plan, "max_population", "Population cap", {"max-population"});
            ::args::Flag white_background(plan, "white_background", "Train against a white background", {"white-background"});

            // init
            ::args::Positional<std::string> init_seed(init, "seed", "Seed point cloud (.ply)");
            ::args::ValueFlag<std::string> init_output(init, "output_path", "Output directory", {'o', "output-path"});
            ::args::ValueFlag<std::string> init_config(init, "config_file", "GSForge config file (json)", {"config"});
            ::args::ValueFlag<float> init_extent(init, "scene_extent", "Scene extent (default: 1.1 x radius of the seed cloud)", {"scene-extent"});

            // inspect / export
            ::args::Positional<std::string> inspect_checkpoint(inspect, "checkpoint", "Checkpoint file (.pt)");
            ::args::Positional<std::string> export_checkpoint(export_ply, "checkpoint", "Checkpoint file (.pt)");
            ::args::ValueFlag<std::string> export_output(export_ply, "output", "Output PLY file", {'o', "output"});

            // Parse arguments
            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::Completion& e) {
                std::print("{}", e.what());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            } catch (const ::args::Error& e) {
                return std::unexpected(std::format("{}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger based on command line arguments
            {
                std::vector<std::pair<gsf::core::LogModule, gsf::core::LogLevel>> module_levels;
                for (const auto& assignment : ::args::get(log_modules)) {
                    auto module_level = parse_module_level(assignment);
                    if (!module_level) {
                        return std::unexpected(module_level.error());
                    }
                    module_levels.push_back(*module_level);
                }

                auto level = gsf::core::LogLevel::Info; // Default level
                std::string log_file_path;

                if (log_level) {
                    level = gsf::core::parse_log_level(::args::get(log_level)).value_or(gsf::core::LogLevel::Info);
                }

                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                auto& logger = gsf::core::Logger::get();
                logger.init(level, log_file_path);
                for (const auto& [module, module_level] : module_levels) {
                    logger.set_module_level(module, module_level);
                }

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            if (help) {
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            }

            if (inspect) {
                if (!inspect_checkpoint) {
                    return std::unexpected(std::format("ERROR: inspect requires a checkpoint path\n\n{}", parser.Help()));
                }
                cmd.command = gsf::args::Command::Inspect;
                cmd.checkpoint_path = ::args::get(inspect_checkpoint);
            } else if (export_ply) {
                if (!export_checkpoint || !export_output) {
                    return std::unexpected(std::format("ERROR: export requires a checkpoint path and --output\n\n{}", parser.Help()));
                }
                cmd.command = gsf::args::Command::Export;
                cmd.checkpoint_path = ::args::get(export_checkpoint);
                cmd.export_path = ::args::get(export_output);
            } else if (init) {
                if (!init_seed || !init_output) {
                    return std::unexpected(std::format("ERROR: init requires a seed point cloud and --output-path\n\n{}", parser.Help()));
                }
                cmd.command = gsf::args::Command::Init;
                cmd.seed_path = ::args::get(init_seed);
                cmd.params.output_path = ::args::get(init_output);
                if (init_config) {
                    cmd.params.optimization.config_file = ::args::get(init_config);
                }
                if (init_extent) {
                    if (!(::args::get(init_extent) > 0.f)) {
                        return std::unexpected("ERROR: --scene-extent must be greater than 0");
                    }
                    cmd.scene_extent = ::args::get(init_extent);
                }
            } else if (plan) {
                cmd.command = gsf::args::Command::Plan;
                if (config_file) {
                    cmd.params.optimization.config_file = ::args::get(config_file);
                }
            } else {
                return std::unexpected(std::format("ERROR: no command given\n\n{}", parser.Help()));
            }

            if (cmd.command == gsf::args::Command::Inspect || cmd.command == gsf::args::Command::Export) {
                if (!std::filesystem::exists(cmd.checkpoint_path)) {
                    return std::unexpected(std::format("Checkpoint file does not exist: {}", cmd.checkpoint_path.string()));
                }
            }

            if (steps_scaler && ::args::get(steps_scaler) <= 0.f) {
                return std::unexpected("ERROR: --steps-scaler must be greater than 0");
            }

            // Create lambda to apply command line overrides after JSON loading
            auto apply_cmd_overrides = [&cmd,
                                        // Capture values, not references
                                        iterations_val = iterations ? std::optional<size_t>(::args::get(iterations)) : std::optional<size_t>(),
                                        sh_degree_val = sh_degree ? std::optional<int>(::args::get(sh_degree)) : std::optional<int>(),
                                        sh_degree_interval_val = sh_degree_interval ? std::optional<size_t>(::args::get(sh_degree_interval)) : std::optional<size_t>(),
                                        densify_from_val = densify_from ? std::optional<size_t>(::args::get(densify_from)) : std::optional<size_t>(),
                                        densify_until_val = densify_until ? std::optional<size_t>(::args::get(densify_until)) : std::optional<size_t>(),
                                        densify_every_val = densify_every ? std::optional<size_t>(::args::get(densify_every)) : std::optional<size_t>(),
                                        opacity_reset_every_val = opacity_reset_every ? std::optional<size_t>(::args::get(opacity_reset_every)) : std::optional<size_t>(),
                                        knn_refresh_every_val = knn_refresh_every ? std::optional<size_t>(::args::get(knn_refresh_every)) : std::optional<size_t>(),
                                        max_population_val = max_population ? std::optional<int64_t>(::args::get(max_population)) : std::optional<int64_t>(),
                                        steps_scaler_val = steps_scaler ? std::optional<float>(::args::get(steps_scaler)) : std::optional<float>(),
                                        // Capture flag states
                                        white_background_flag = bool(white_background)]() {
                auto& opt = cmd.params.optimization;

                // Simple lambdas to apply if flag/value exists
                auto setVal = [](const auto& flag, auto& target) {
                    if (flag)
                        target = *flag;
                };

                auto setFlag = [](bool flag, auto& target) {
                    if (flag)
                        target = true;
                };

                setVal(iterations_val, opt.iterations);
                setVal(sh_degree_val, opt.sh_degree);
                setVal(sh_degree_interval_val, opt.sh_degree_interval);
                setVal(densify_from_val, opt.densify_from_iter);
                setVal(densify_until_val, opt.densify_until_iter);
                setVal(densify_every_val, opt.densification_interval);
                setVal(opacity_reset_every_val, opt.opacity_reset_interval);
                setVal(knn_refresh_every_val, opt.knn_refresh_interval);
                if (max_population_val) {
                    opt.max_population = *max_population_val;
                }
                if (steps_scaler_val) {
                    opt.steps_scaler = *steps_scaler_val;
                }

                setFlag(white_background_flag, opt.white_background);
            };

            return std::make_tuple(ParseResult::Success, apply_cmd_overrides);

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    void apply_step_scaling(gsf::param::TrainingParameters& params) {
        auto& opt = params.optimization;
        const float scaler = opt.steps_scaler;

        if (scaler > 0) {
            LOG_INFO("Scaling training steps by factor: {}", scaler);

            const auto scale = [scaler](size_t& steps) {
                steps = static_cast<size_t>(static_cast<float>(steps) * scaler);
            };
            scale(opt.iterations);
            scale(opt.position_lr_max_steps);
            scale(opt.densify_from_iter);
            scale(opt.densify_until_iter);
            scale(opt.densification_interval);
            scale(opt.size_threshold_from_iter);
            scale(opt.opacity_reset_interval);
            scale(opt.knn_refresh_interval);
            scale(opt.sh_degree_interval);

            const auto int_scaler = static_cast<size_t>(scaler);
            if (int_scaler >= 1) {
                scale_steps_vector(opt.test_iterations, int_scaler);
                scale_steps_vector(opt.save_iterations, int_scaler);
                scale_steps_vector(opt.checkpoint_iterations, int_scaler);
            }
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }
} // anonymous namespace

// Public interface
std::expected<std::unique_ptr<gsf::args::CommandLine>, std::string>
gsf::args::parse_args_and_params(int argc, const char* const argv[]) {

    auto cmd = std::make_unique<gsf::args::CommandLine>();

    auto parse_result = parse_arguments(convert_args(argc, argv), *cmd);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    auto [result, apply_overrides] = *parse_result;

    if (result == ParseResult::Help) {
        cmd->command = Command::Help;
        return cmd;
    }

    // Checkpoints carry their own shapes; only planning and seeding need a configuration
    if (cmd->command == Command::Plan || cmd->command == Command::Init) {
        const std::string config_file = cmd->params.optimization.config_file;
        const std::filesystem::path config_file_to_read = !config_file.empty()
                                                              ? std::filesystem::u8path(config_file)
                                                              : get_config_path("default_optimization_params.json");

        auto opt_params_result = gsf::param::read_optim_params_from_json(config_file_to_read);
        if (!opt_params_result) {
            return std::unexpected(std::format("Failed to load optimization parameters: {}",
                                               opt_params_result.error()));
        }
        cmd->params.optimization = *opt_params_result;
        cmd->params.optimization.config_file = config_file_to_read.string();

        if (apply_overrides) {
            apply_overrides();
        }

        apply_step_scaling(cmd->params);
    }

    return cmd;
}
