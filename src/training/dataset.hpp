/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace gsf::training {
    // Calibrated camera as far as training needs it. Intrinsics and pose stay opaque to the
    // core and are interpreted by the renderer.
    struct CameraView {
        int uid = 0;
        std::string image_name;
        torch::Tensor world_view_transform; // [4, 4]
        torch::Tensor camera_center;        // [3]
        float fov_x = 0.f;
        float fov_y = 0.f;
        int width = 0;
        int height = 0;
    };

    struct TrainingView {
        CameraView camera;
        torch::Tensor image; // [3, H, W] ground truth in [0, 1]
    };

    class IViewSource {
    public:
        virtual ~IViewSource() = default;

        virtual const std::vector<TrainingView>& train_views() const = 0;
        virtual const std::vector<TrainingView>& test_views() const = 0;
        virtual float scene_extent() const = 0;
    };

    // In-memory view source, used by tools and tests
    class ViewList : public IViewSource {
    public:
        ViewList(std::vector<TrainingView> train, std::vector<TrainingView> test, float extent)
            : _train(std::move(train)),
              _test(std::move(test)),
              _extent(extent) {
        }

        const std::vector<TrainingView>& train_views() const override { return _train; }
        const std::vector<TrainingView>& test_views() const override { return _test; }
        float scene_extent() const override { return _extent; }

    private:
        std::vector<TrainingView> _train;
        std::vector<TrainingView> _test;
        float _extent;
    };

    // 1.1 x the largest distance of a camera centre from the mean centre
    float compute_scene_extent(const torch::Tensor& camera_centers);

    // Draws training views at random without replacement, refilling the stack every epoch
    class ViewSampler {
    public:
        explicit ViewSampler(size_t num_views) : _num_views(num_views) {}

        size_t next();

    private:
        size_t _num_views;
        std::vector<int64_t> _stack;
    };
} // namespace gsf::training
