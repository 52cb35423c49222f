/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>

namespace gsf::param {
    struct OptimizationParameters;
}

namespace gsf::training {
    // Log-linear decay from lr_init to lr_final over max_steps, with an optional sine-shaped warmup.
    // A pure function of the step, so resuming from a checkpoint reproduces the same rate.
    class ExponentialDecayLR {
    public:
        ExponentialDecayLR(double lr_init,
                           double lr_final,
                           size_t max_steps,
                           double delay_mult = 1.0,
                           size_t delay_steps = 0)
            : lr_init_(lr_init),
              lr_final_(lr_final),
              max_steps_(max_steps),
              delay_mult_(delay_mult),
              delay_steps_(delay_steps) {
        }

        static ExponentialDecayLR for_positions(const param::OptimizationParameters& params, float scene_extent);

        double operator()(size_t step) const;

    private:
        double lr_init_;
        double lr_final_;
        size_t max_steps_;
        double delay_mult_;
        size_t delay_steps_;
    };
} // namespace gsf::training
