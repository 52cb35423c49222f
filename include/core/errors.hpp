/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <stdexcept>
#include <string>

namespace gsf {

    // Missing or invalid thresholds, intervals or iteration boundaries. Fatal at startup.
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
    };

    // A snapshot whose shapes disagree with the configured model. No partial recovery.
    class CheckpointFormatError : public std::runtime_error {
    public:
        explicit CheckpointFormatError(const std::string& what) : std::runtime_error(what) {}
    };

} // namespace gsf
