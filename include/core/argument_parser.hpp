/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace gsf {
    namespace args {
        enum class Command {
            Plan,    // print the phase boundaries and every scheduled task of a configuration
            Init,    // seed a population from a point cloud and write the starting checkpoint
            Inspect, // summarise a checkpoint
            Export,  // write a checkpoint's population as PLY
            Help
        };

        struct CommandLine {
            Command command = Command::Help;
            param::TrainingParameters params;
            std::filesystem::path checkpoint_path;
            std::filesystem::path export_path;
            std::filesystem::path seed_path;
            std::optional<float> scene_extent; // derived from the seed cloud when unset
        };

        /**
         * @brief Parse command-line arguments and load parameters from JSON
         * @param argc Number of arguments
         * @param argv Array of argument strings (const-correct)
         * @return Expected CommandLine or error message
         */
        std::expected<std::unique_ptr<CommandLine>, std::string>
        parse_args_and_params(int argc, const char* const argv[]);
    } // namespace args
} // namespace gsf
