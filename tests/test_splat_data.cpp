/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/point_cloud.hpp"
#include "core/splat_data.hpp"
#include "splat_test_utils.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <numbers>
#include <string>
#include <torch/torch.h>

using namespace gsf;

class SplatDataTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "gsforge_splat_data_test";
        std::filesystem::create_directories(temp_dir_);
        torch::manual_seed(11);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    std::filesystem::path temp_dir_;
};

TEST_F(SplatDataTest, ConstructorRejectsMismatchedRows) {
    EXPECT_THROW(SplatData(0,
                           torch::zeros({4, 3}),
                           torch::zeros({4, 1, 3}),
                           torch::zeros({4, 0, 3}),
                           torch::zeros({3, 3}),
                           torch::zeros({4, 4}),
                           torch::zeros({4, 1}),
                           torch::ones({4}, torch::kInt32),
                           1.f),
                 std::invalid_argument);

    EXPECT_THROW(SplatData(0,
                           torch::zeros({4, 3}),
                           torch::zeros({4, 1, 3}),
                           torch::zeros({4, 0, 3}),
                           torch::zeros({4, 3}),
                           torch::zeros({4, 4}),
                           torch::zeros({4, 1}),
                           torch::ones({5}, torch::kInt32),
                           1.f),
                 std::invalid_argument);
}

TEST_F(SplatDataTest, ActivatedGetters) {
    auto splat = test::make_splat(torch::zeros({2, 3}), torch::tensor({0.5f, 2.f}), torch::tensor({0.25f, 0.75f}));

    EXPECT_TRUE(torch::allclose(splat.get_opacity(), torch::tensor({0.25f, 0.75f})));
    EXPECT_TRUE(torch::allclose(splat.get_scaling().select(1, 2), torch::tensor({0.5f, 2.f})));
    EXPECT_EQ(splat.get_shs().sizes(), (std::vector<int64_t>{2, 4, 3}));
    EXPECT_TRUE(torch::allclose(splat.get_rotation().norm(2, -1), torch::ones({2})));
}

TEST_F(SplatDataTest, IdentityRotationNormalIsZAxis) {
    auto splat = test::make_uniform_splat(3);

    const auto normals = splat.get_normals();
    EXPECT_TRUE(torch::allclose(normals, torch::tensor({0.f, 0.f, 1.f}).expand({3, 3})));
}

TEST_F(SplatDataTest, QuaternionToRotationMatrix) {
    // 90 degrees about z, (w, x, y, z)
    const float h = static_cast<float>(std::sqrt(0.5));
    const auto R = quat_to_rotmat(torch::tensor({{h, 0.f, 0.f, h}}));

    const auto expected = torch::tensor({{0.f, -1.f, 0.f}, {1.f, 0.f, 0.f}, {0.f, 0.f, 1.f}}).unsqueeze(0);
    EXPECT_EQ(R.sizes(), (std::vector<int64_t>{1, 3, 3}));
    EXPECT_TRUE(torch::allclose(R, expected, 1e-5, 1e-6));
}

TEST_F(SplatDataTest, CountsByType) {
    auto splat = test::make_splat(torch::zeros({4, 3}), torch::full({4}, 0.1f), torch::full({4}, 0.5f),
                                  torch::tensor({1, 0, 0, 1}, torch::kInt32));

    EXPECT_EQ(splat.count(PrimitiveType::Surface), 2);
    EXPECT_EQ(splat.count(PrimitiveType::Generic), 2);
}

TEST_F(SplatDataTest, ShDegreeEscalationStopsAtMax) {
    auto splat = test::make_uniform_splat(2, 0.3f, 0.5f, 2);

    EXPECT_EQ(splat.get_active_sh_degree(), 0);
    EXPECT_TRUE(splat.increment_sh_degree());
    EXPECT_TRUE(splat.increment_sh_degree());
    EXPECT_FALSE(splat.increment_sh_degree());
    EXPECT_EQ(splat.get_active_sh_degree(), 2);

    splat.set_active_sh_degree(7);
    EXPECT_EQ(splat.get_active_sh_degree(), 2);
}

TEST_F(SplatDataTest, ApplyBuildsNewLayoutAndBumpsGeneration) {
    auto means = torch::arange(12, torch::kFloat32).view({4, 3});
    auto splat = test::make_splat(means, torch::full({4}, 0.1f), torch::full({4}, 0.5f));
    const auto generation = splat.generation();

    CompactionPlan plan;
    plan.keep = torch::tensor({0, 2}, torch::kInt64);
    plan.parents = torch::tensor({3}, torch::kInt64);
    plan.warm_start = torch::tensor({true});
    for (auto id : kAllParams) {
        plan.born[to_index(id)] = splat.param(id).detach().index_select(0, plan.parents);
    }
    plan.born_types = torch::tensor({0}, torch::kInt32);

    splat.apply(plan);

    EXPECT_EQ(splat.size(), 3);
    EXPECT_GT(splat.generation(), generation);
    EXPECT_TRUE(splat.means().requires_grad());
    EXPECT_TRUE(torch::equal(splat.means().detach().select(1, 0), torch::tensor({0.f, 6.f, 9.f})));
    EXPECT_TRUE(torch::equal(splat.types(), torch::tensor({1, 1, 0}, torch::kInt32)));
}

TEST_F(SplatDataTest, ReplaceAdvancesGenerationPastBoth) {
    auto a = test::make_uniform_splat(3);
    auto b = test::make_uniform_splat(7);

    CompactionPlan plan;
    plan.keep = torch::arange(3, torch::kInt64);
    a.apply(plan);
    a.apply(plan);
    const auto before = a.generation();

    a.replace(std::move(b));

    EXPECT_EQ(a.size(), 7);
    EXPECT_GT(a.generation(), before);
}

TEST_F(SplatDataTest, InitFromPointCloud) {
    param::TrainingParameters params;
    params.optimization.sh_degree = 2;
    params.optimization.init_opacity = 0.1f;

    PointCloud cloud(torch::rand({50, 3}), torch::randint(0, 256, {50, 3}, torch::kUInt8));

    auto result = SplatData::init_model_from_pointcloud(params, cloud, 3.f);
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& splat = *result;
    EXPECT_EQ(splat.size(), 50);
    EXPECT_EQ(splat.get_max_sh_degree(), 2);
    EXPECT_EQ(splat.get_active_sh_degree(), 0);
    EXPECT_FLOAT_EQ(splat.get_scene_scale(), 3.f);
    EXPECT_EQ(splat.shN().sizes(), (std::vector<int64_t>{50, 8, 3}));
    EXPECT_TRUE(torch::allclose(splat.get_opacity(), torch::full({50}, 0.1f)));
    EXPECT_TRUE(torch::isfinite(splat.scaling_raw()).all().item<bool>());
    EXPECT_EQ(splat.count(PrimitiveType::Surface), 50);
    EXPECT_TRUE(splat.means().requires_grad());
}

TEST_F(SplatDataTest, InitUsesPointTypesWhenPresent) {
    param::TrainingParameters params;
    params.optimization.sh_degree = 0;

    PointCloud cloud(torch::rand({4, 3}), torch::rand({4, 3}));
    cloud.types = torch::tensor({0, 0, 1, 0}, torch::kInt32);

    auto result = SplatData::init_model_from_pointcloud(params, cloud, 1.f);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->count(PrimitiveType::Generic), 3);
}

TEST_F(SplatDataTest, InitRejectsEmptyCloud) {
    param::TrainingParameters params;
    EXPECT_FALSE(SplatData::init_model_from_pointcloud(params, PointCloud{}, 1.f).has_value());
}

TEST_F(SplatDataTest, SavePlyWritesHeader) {
    auto splat = test::make_uniform_splat(5);
    const auto path = temp_dir_ / "out" / "point_cloud.ply";

    splat.save_ply(path);

    ASSERT_TRUE(std::filesystem::exists(path));
    std::ifstream file(path, std::ios::binary);
    std::string line;
    std::getline(file, line);
    EXPECT_EQ(line, "ply");

    bool saw_vertex_count = false;
    bool saw_type = false;
    while (std::getline(file, line) && line != "end_header") {
        saw_vertex_count |= line == "element vertex 5";
        saw_type |= line.find("property int type") != std::string::npos;
    }
    EXPECT_TRUE(saw_vertex_count);
    EXPECT_TRUE(saw_type);
}
