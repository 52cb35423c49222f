/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "blend_renderer.hpp"
#include "checkpoint.hpp"
#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "splat_test_utils.hpp"
#include "training_setup.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <torch/torch.h>

using namespace gsf;
using namespace gsf::training;

class TrainingSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(5);
        temp_dir_ = std::filesystem::temp_directory_path() / "gsforge_training_setup_test";
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);

        params_.optimization = test::make_test_params();
        params_.optimization.iterations = 20;
        params_.optimization.densify_until_iter = 20;
        params_.optimization.telemetry = "local";
        params_.output_path = temp_dir_ / "run";
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    static PointCloud make_seed(int64_t n) {
        return PointCloud(torch::rand({n, 3}), torch::randint(0, 256, {n, 3}, torch::kUInt8));
    }

    size_t count_records(const std::string& name) const {
        std::ifstream file(params_.output_path / "metrics.jsonl");
        size_t count = 0;
        std::string line;
        while (std::getline(file, line)) {
            if (nlohmann::json::parse(line)["name"] == name) {
                ++count;
            }
        }
        return count;
    }

    std::filesystem::path temp_dir_;
    param::TrainingParameters params_;
};

TEST_F(TrainingSetupTest, TelemetryFollowsConfiguration) {
    auto local = setup_telemetry(params_);
    ASSERT_TRUE(local.has_value()) << local.error();
    auto* jsonl = dynamic_cast<JsonlTelemetrySink*>(local->get());
    ASSERT_NE(jsonl, nullptr);
    EXPECT_EQ(jsonl->path(), params_.output_path / "metrics.jsonl");

    params_.optimization.telemetry = "none";
    auto none = setup_telemetry(params_);
    ASSERT_TRUE(none.has_value());
    EXPECT_NE(dynamic_cast<NullTelemetrySink*>(none->get()), nullptr);

    params_.optimization.telemetry = "wandb";
    EXPECT_FALSE(setup_telemetry(params_).has_value());
}

TEST_F(TrainingSetupTest, PopulationIsSeededFromPointCloud) {
    auto population = setup_population(params_, make_seed(25), 2.f);
    ASSERT_TRUE(population.has_value()) << population.error();

    const auto& splat = (*population)->splat_data();
    EXPECT_EQ((*population)->size(), 25);
    EXPECT_EQ((*population)->stats().size(), 25);
    EXPECT_EQ((*population)->optimizer().size(), 25);
    EXPECT_EQ(splat.count(PrimitiveType::Surface), 25);
    EXPECT_EQ(splat.get_max_sh_degree(), params_.optimization.sh_degree);
    EXPECT_FLOAT_EQ(splat.get_scene_scale(), 2.f);
}

TEST_F(TrainingSetupTest, PopulationRejectsBadInput) {
    EXPECT_FALSE(setup_population(params_, PointCloud{}, 1.f).has_value());

    params_.optimization.position_lr_final = 0.f;
    const auto invalid = setup_population(params_, make_seed(10), 1.f);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_NE(invalid.error().find("position_lr_final"), std::string::npos);
}

TEST_F(TrainingSetupTest, RequiresRendererAndViews) {
    auto views = std::make_shared<ViewList>(test::make_views(2), test::make_views(1), 1.f);

    EXPECT_FALSE(setup_training(params_, make_seed(10), nullptr, views).has_value());
    EXPECT_FALSE(setup_training(params_, make_seed(10), std::make_shared<test::BlendRenderer>(), nullptr).has_value());
}

TEST_F(TrainingSetupTest, WiresTelemetryIntoTrainer) {
    auto renderer = std::make_shared<test::BlendRenderer>();
    auto views = std::make_shared<ViewList>(test::make_views(3), test::make_views(1), 1.f);

    auto setup = setup_training(params_, make_seed(30), renderer, views);
    ASSERT_TRUE(setup.has_value()) << setup.error();
    ASSERT_NE(setup->telemetry, nullptr);
    ASSERT_NE(setup->trainer, nullptr);

    ASSERT_TRUE(setup->trainer->initialize(params_).has_value());
    const auto result = setup->trainer->train();
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(setup->trainer->current_iteration(), 20u);
    EXPECT_EQ(renderer->calls, 20);
    EXPECT_EQ(count_records("n_gaussians"), 20u);
    EXPECT_EQ(count_records("train/l1_loss"), 20u);
    EXPECT_TRUE(std::filesystem::exists(params_.output_path / "point_cloud" / "iteration_20" / "point_cloud.ply"));
}

TEST_F(TrainingSetupTest, InitCommandWritesStartingCheckpoint) {
    const auto seed_path = temp_dir_ / "seed.ply";
    std::ofstream(seed_path) << "ply\n"
                                "format ascii 1.0\n"
                                "element vertex 4\n"
                                "property float x\n"
                                "property float y\n"
                                "property float z\n"
                                "end_header\n"
                                "0 0 0\n"
                                "1 0 0\n"
                                "0 2 0\n"
                                "0 0 3\n";

    auto config = param::OptimizationParameters{};
    config.telemetry = "local";
    const auto config_path = temp_dir_ / "config.json";
    std::ofstream(config_path) << config.to_json().dump(4);

    const auto seed_arg = seed_path.string();
    const auto output_arg = params_.output_path.string();
    const auto config_arg = config_path.string();
    const char* argv[] = {"gsforge", "init", seed_arg.c_str(),
                          "--output-path", output_arg.c_str(),
                          "--config", config_arg.c_str(),
                          "--log-level", "off"};

    auto cmd = args::parse_args_and_params(9, argv);
    ASSERT_TRUE(cmd.has_value()) << cmd.error();
    ASSERT_EQ((*cmd)->command, args::Command::Init);

    Application app;
    ASSERT_EQ(app.run(std::move(*cmd)), 0);

    const auto checkpoint = load_checkpoint(params_.output_path / "chkpnt0.pt");
    ASSERT_TRUE(checkpoint.has_value()) << checkpoint.error();
    EXPECT_EQ(checkpoint->iteration, 0);
    EXPECT_EQ(checkpoint->size(), 4);
    EXPECT_EQ(checkpoint->max_sh_degree, config.sh_degree);
    EXPECT_GT(checkpoint->scene_scale, 0.f);

    EXPECT_TRUE(std::filesystem::exists(params_.output_path / "training_config.json"));
    EXPECT_EQ(count_records("n_gaussians"), 1u);
}
