/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <memory>

namespace gsf {

    namespace args {
        struct CommandLine;
    } // namespace args

    class Application {
    public:
        int run(std::unique_ptr<args::CommandLine> cmd);
    };

} // namespace gsf
