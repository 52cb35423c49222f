/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scheduler.hpp"
#include "core/parameters.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace gsf::training {
    ExponentialDecayLR ExponentialDecayLR::for_positions(const param::OptimizationParameters& params, float scene_extent) {
        return ExponentialDecayLR(params.position_lr_init * scene_extent,
                                  params.position_lr_final * scene_extent,
                                  params.position_lr_max_steps,
                                  params.position_lr_delay_mult,
                                  params.position_lr_delay_steps);
    }

    double ExponentialDecayLR::operator()(size_t step) const {
        if (lr_init_ == 0.0 && lr_final_ == 0.0) {
            return 0.0;
        }

        double delay_rate = 1.0;
        if (delay_steps_ > 0) {
            const double progress = std::clamp(static_cast<double>(step) / static_cast<double>(delay_steps_), 0.0, 1.0);
            delay_rate = delay_mult_ + (1.0 - delay_mult_) * std::sin(0.5 * std::numbers::pi * progress);
        }

        const double t = max_steps_ > 0
                             ? std::clamp(static_cast<double>(step) / static_cast<double>(max_steps_), 0.0, 1.0)
                             : 1.0;
        const double log_lerp = std::exp(std::log(lr_init_) * (1.0 - t) + std::log(lr_final_) * t);
        return delay_rate * log_lerp;
    }
} // namespace gsf::training
