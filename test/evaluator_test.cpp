#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "Hermes.h"
#include "common.hpp"

namespace Hermes::Tests {
    TEST(Evaluator, ObjectiveIsRepeatableOnTheSameMinibatch)
    {
        auto model = make_model();
        const auto w = model.parameters().clone();
        const double first = model.objective(w);
        const double second = model.objective(w);
        EXPECT_DOUBLE_EQ(first, second);
        EXPECT_TRUE(std::isfinite(first));
        EXPECT_GT(first, 0.0);
    }

    TEST(Evaluator, ObjectiveMatchesManualLoss)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();
        const double value = model.objective(w);

        const auto& batch = model.current_minibatch(Data::Split::Train);
        torch::NoGradGuard no_grad;
        const auto expected = torch::nn::functional::cross_entropy(model.chain()->forward(batch.inputs), batch.targets);
        EXPECT_NEAR(value, expected.item<double>(), 1e-12);
    }

    TEST(Evaluator, ObjectiveAndGradientAgreeWithSeparateCalls)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = torch::randn({kDimension}, torch::kFloat64);

        const double f = model.objective(w);
        const auto g = model.gradient(w);
        auto buffer = torch::zeros({kDimension}, torch::kFloat64);
        const auto [value, gradient] = model.objective_and_gradient(w, buffer);

        EXPECT_DOUBLE_EQ(value, f);
        EXPECT_TRUE(torch::allclose(gradient, g, 1e-12, 1e-12));
        EXPECT_TRUE(torch::allclose(buffer, g, 1e-12, 1e-12));
    }

    TEST(Evaluator, GradientWritesIntoCallerBuffer)
    {
        auto model = make_model();
        const auto w = model.parameters().clone();
        auto g = torch::zeros({kDimension});
        auto& result = model.gradient(w, g);
        EXPECT_EQ(&result, &g);
        EXPECT_GT(g.abs().sum().item<double>(), 0.0);
    }

    TEST(Evaluator, AdvancingChangesTheObjective)
    {
        auto model = make_model();
        const auto w = model.parameters().clone();

        model.reset_minibatch(Data::Split::Train);
        ASSERT_TRUE(model.minibatch_next(Data::Split::Train));
        const double first = model.objective(w);
        ASSERT_TRUE(model.minibatch_next(Data::Split::Train));
        const double second = model.objective(w);
        EXPECT_NE(first, second);
    }

    TEST(Evaluator, EvaluationNeverMovesTheCursors)
    {
        auto model = make_model();
        const auto w = model.parameters().clone();
        ASSERT_TRUE(model.minibatch_next(Data::Split::Train));
        const auto before = model.current_minibatch(Data::Split::Train).inputs;

        (void)model.objective(w);
        (void)model.gradient(w);
        (void)model.hessian(w);

        EXPECT_EQ(*model.cursor(Data::Split::Train).status(), 0U);
        EXPECT_TRUE(torch::equal(model.current_minibatch(Data::Split::Train).inputs, before));
        EXPECT_FALSE(model.cursor(Data::Split::Test).status().has_value());
    }

    TEST(Evaluator, EvaluationWritesTheVectorIntoTheModel)
    {
        auto model = make_model();
        const auto w = torch::randn({kDimension});
        (void)model.objective(w);
        EXPECT_TRUE(torch::equal(model.parameters(), w));
        EXPECT_TRUE(torch::equal(Parameter::Flatten(*model.chain()), w));
    }

    TEST(Evaluator, WrongLengthIsRejectedBeforeAnyMutation)
    {
        auto model = make_model();
        const auto before = model.parameters().clone();
        const auto w = torch::randn({kDimension});

        EXPECT_THROW((void)model.objective(torch::randn({kDimension - 1})), LengthMismatch);
        EXPECT_THROW((void)model.gradient(torch::randn({kDimension - 1})), LengthMismatch);

        auto short_buffer = torch::zeros({kDimension - 1});
        EXPECT_THROW(model.gradient(w, short_buffer), LengthMismatch);
        EXPECT_THROW((void)model.objective_and_gradient(w, short_buffer), LengthMismatch);

        auto square = torch::zeros({kDimension - 1, kDimension - 1});
        EXPECT_THROW(model.hessian(w, square), LengthMismatch);

        auto hv = torch::zeros({kDimension});
        EXPECT_THROW(model.hessian_vector_product(w, torch::ones({kDimension + 1}), hv), LengthMismatch);

        EXPECT_TRUE(torch::equal(model.parameters(), before));
        EXPECT_TRUE(torch::equal(Parameter::Flatten(*model.chain()), before));
        EXPECT_EQ(model.counters().total(), 0);
    }

    TEST(Evaluator, GradientMatchesCentralDifferences)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();
        const auto g = model.gradient(w);

        constexpr double h = 1e-6;
        for (std::int64_t i = 0; i < kDimension; ++i) {
            auto plus = w.clone();
            auto minus = w.clone();
            plus[i].add_(h);
            minus[i].sub_(h);
            const double estimate = (model.objective(plus) - model.objective(minus)) / (2.0 * h);
            EXPECT_NEAR(g[i].item<double>(), estimate, 1e-6) << "coordinate " << i;
        }
    }

    TEST(Evaluator, HessianIsSymmetricAndMatchesProducts)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();

        const auto h = model.hessian(w);
        ASSERT_EQ(h.size(0), kDimension);
        ASSERT_EQ(h.size(1), kDimension);
        EXPECT_TRUE(torch::allclose(h, h.transpose(0, 1), 1e-9, 1e-10));

        const auto v = torch::randn({kDimension}, torch::kFloat64);
        auto hv = torch::zeros({kDimension}, torch::kFloat64);
        model.hessian_vector_product(w, v, hv);
        EXPECT_TRUE(torch::allclose(hv, torch::mv(h, v), 1e-9, 1e-10));
    }

    TEST(Evaluator, HessianMatchesGradientDifferences)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();
        const auto h = model.hessian(w);

        constexpr double step = 1e-6;
        for (std::int64_t i = 0; i < kDimension; i += 6) {
            auto plus = w.clone();
            auto minus = w.clone();
            plus[i].add_(step);
            minus[i].sub_(step);
            const auto column = (model.gradient(plus) - model.gradient(minus)) / (2.0 * step);
            EXPECT_TRUE(torch::allclose(h.select(1, i), column, 1e-4, 1e-6)) << "column " << i;
        }
    }

    TEST(Evaluator, DoubleVectorConvertsSinglePrecisionState)
    {
        auto model = make_model(torch::kFloat32);
        ASSERT_EQ(model.precision(), Precision::Float32);
        const auto w = model.parameters().to(torch::kFloat64);

        const double value = model.objective(w);
        EXPECT_TRUE(std::isfinite(value));
        EXPECT_EQ(model.precision(), Precision::Float64);
        EXPECT_EQ(model.parameters().scalar_type(), torch::kFloat64);
        for (const auto& parameter : model.chain()->parameters()) {
            EXPECT_EQ(parameter.scalar_type(), torch::kFloat64);
        }
        EXPECT_EQ(model.current_minibatch(Data::Split::Train).inputs.scalar_type(), torch::kFloat64);
        EXPECT_EQ(model.current_minibatch(Data::Split::Test).inputs.scalar_type(), torch::kFloat64);
        EXPECT_EQ(model.current_minibatch(Data::Split::Train).targets.scalar_type(), torch::kLong);

        ASSERT_TRUE(model.minibatch_next(Data::Split::Train));
        EXPECT_EQ(model.current_minibatch(Data::Split::Train).inputs.scalar_type(), torch::kFloat64);

        const auto g = model.gradient(w);
        EXPECT_EQ(g.scalar_type(), torch::kFloat64);
    }

    TEST(Evaluator, SinglePrecisionVectorConvertsBack)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().to(torch::kFloat32);
        (void)model.objective(w);
        EXPECT_EQ(model.precision(), Precision::Float32);
        EXPECT_EQ(model.current_minibatch(Data::Split::Train).inputs.scalar_type(), torch::kFloat32);
    }

    TEST(Evaluator, CountersTrackEveryOperation)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();
        auto g = torch::zeros({kDimension}, torch::kFloat64);
        auto hv = torch::zeros({kDimension}, torch::kFloat64);

        (void)model.objective(w);
        (void)model.gradient(w);
        (void)model.objective_and_gradient(w, g);
        (void)model.hessian(w);
        model.hessian_vector_product(w, torch::ones({kDimension}, torch::kFloat64), hv);

        const auto& counters = model.counters();
        EXPECT_EQ(counters.neval_obj, 2);
        EXPECT_EQ(counters.neval_grad, 2);
        EXPECT_EQ(counters.neval_hess, 1);
        EXPECT_EQ(counters.neval_hprod, 1);
        EXPECT_EQ(counters.total(), 6);

        (void)model.accuracy();
        EXPECT_EQ(model.counters().total(), 6);

        model.reset_counters();
        EXPECT_EQ(model.counters().total(), 0);
    }

    TEST(Evaluator, ObjectiveOnTestSplitUsesTheTestMinibatch)
    {
        auto model = make_model(torch::kFloat64);
        const auto w = model.parameters().clone();

        EXPECT_DOUBLE_EQ(model.objective_on(Data::Split::Train, w), model.objective(w));

        const double value = model.objective_on(Data::Split::Test, w);
        const auto& batch = model.current_minibatch(Data::Split::Test);
        torch::NoGradGuard no_grad;
        const auto expected = torch::nn::functional::cross_entropy(model.chain()->forward(batch.inputs), batch.targets);
        EXPECT_NEAR(value, expected.item<double>(), 1e-12);
    }

    TEST(Evaluator, CustomLossCallableIsUsed)
    {
        torch::manual_seed(12);
        auto train = make_blobs(40, torch::kFloat64);
        auto test = make_blobs(20, torch::kFloat64);
        Loss::Function squared_logits = [](const torch::Tensor& prediction, const torch::Tensor&) {
            return prediction.pow(2).sum();
        };
        Model model(make_classifier(torch::kFloat64), train, test, quiet_options(), squared_logits);

        const auto w = torch::zeros({kDimension}, torch::kFloat64);
        EXPECT_DOUBLE_EQ(model.objective(w), 0.0);
        EXPECT_EQ(model.gradient(w).abs().sum().item<double>(), 0.0);
    }

    TEST(Evaluator, MeanSquaredErrorDescriptor)
    {
        torch::manual_seed(13);
        auto train = make_blobs(40, torch::kFloat64);
        auto test = make_blobs(20, torch::kFloat64);
        train.targets = Tests::to_one_hot(train).targets;
        test.targets = Tests::to_one_hot(test).targets;
        Model model(make_classifier(torch::kFloat64), train, test, quiet_options(), Loss::Descriptor{Loss::MSE()});

        const auto w = model.parameters().clone();
        const double value = model.objective(w);
        const auto& batch = model.current_minibatch(Data::Split::Train);
        torch::NoGradGuard no_grad;
        const auto expected = (model.chain()->forward(batch.inputs) - batch.targets).pow(2).mean();
        EXPECT_NEAR(value, expected.item<double>(), 1e-12);
    }
    TEST(Evaluator, SinglePrecisionBuffersFollowADoubleVector)
    {
        auto model = make_model(torch::kFloat32);
        const auto w = model.parameters().to(torch::kFloat64);
        const auto v = torch::randn({kDimension}, torch::kFloat64);

        auto g = torch::zeros({kDimension});
        auto& result = model.gradient(w, g);
        EXPECT_EQ(&result, &g);
        EXPECT_EQ(g.scalar_type(), torch::kFloat64);
        const auto expected = model.gradient(w);
        EXPECT_TRUE(torch::allclose(g, expected, 1e-12, 1e-12));

        auto fg = torch::zeros({kDimension});
        const auto [value, gradient] = model.objective_and_gradient(w, fg);
        EXPECT_TRUE(std::isfinite(value));
        EXPECT_EQ(fg.scalar_type(), torch::kFloat64);
        EXPECT_TRUE(torch::allclose(gradient, expected, 1e-12, 1e-12));

        auto h = torch::zeros({kDimension, kDimension});
        model.hessian(w, h);
        EXPECT_EQ(h.scalar_type(), torch::kFloat64);

        auto hv = torch::zeros({kDimension});
        model.hessian_vector_product(w, v, hv);
        EXPECT_EQ(hv.scalar_type(), torch::kFloat64);
        EXPECT_TRUE(torch::allclose(hv, torch::mv(h, v), 1e-9, 1e-10));
    }
}
