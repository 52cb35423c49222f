/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>

int main(int argc, char* argv[]) {
    // Parse arguments (this automatically initializes the logger based on --log-level flag)
    auto params_result = gsf::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    LOG_DEBUG("GSForge");

    gsf::Application app;
    const int result = app.run(std::move(*params_result));

    gsf::core::Logger::get().flush();
    return result;
}
