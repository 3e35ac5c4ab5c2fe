#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "Hermes.h"

namespace Hermes::Tests {
    namespace {
        // Sample i carries the value i in its single feature, so batches can be traced back to rows.
        Data::Dataset indexed_dataset(std::int64_t count)
        {
            auto inputs = torch::arange(count, torch::kFloat32).unsqueeze(1);
            auto targets = torch::arange(count, torch::kLong).remainder(3);
            return {inputs, targets};
        }

        Data::Cursor make_cursor(std::int64_t count, std::int64_t size_minibatch, bool shuffle, std::uint64_t seed = 11)
        {
            Data::CursorOptions options{};
            options.size_minibatch = size_minibatch;
            options.shuffle = shuffle;
            return Data::Cursor(indexed_dataset(count), options, Random::Source(seed));
        }
    }

    TEST(MinibatchCursor, PartitionsThousandSamplesIntoHundredBatchesOfTen)
    {
        auto cursor = make_cursor(1000, 100, /*shuffle=*/false);
        EXPECT_EQ(cursor.batch_count(), 100U);
        EXPECT_EQ(cursor.batch_size(), 10);
        EXPECT_EQ(cursor.current().inputs.size(0), 10);
        EXPECT_FALSE(cursor.status().has_value());
        EXPECT_EQ(cursor.state(), Data::CursorState::Ready);
    }

    TEST(MinibatchCursor, AdvanceVisitsEveryBatchThenStaysExhausted)
    {
        auto cursor = make_cursor(1000, 100, /*shuffle=*/false);
        for (std::size_t i = 0; i < 100; ++i) {
            ASSERT_TRUE(cursor.advance()) << "batch " << i;
            ASSERT_TRUE(cursor.status().has_value());
            EXPECT_EQ(*cursor.status(), i);
            EXPECT_EQ(cursor.current().inputs[0][0].item<float>(), static_cast<float>(i * 10));
        }
        EXPECT_FALSE(cursor.advance());
        EXPECT_TRUE(cursor.exhausted());
        EXPECT_EQ(cursor.state(), Data::CursorState::Exhausted);
        EXPECT_FALSE(cursor.advance());
        EXPECT_FALSE(cursor.advance());
        EXPECT_EQ(*cursor.status(), 99U);
        EXPECT_EQ(cursor.current().inputs[0][0].item<float>(), 990.0F);
    }

    TEST(MinibatchCursor, ResetRestartsFromFirstBatch)
    {
        auto cursor = make_cursor(1000, 100, /*shuffle=*/false);
        while (cursor.advance()) {
        }
        ASSERT_TRUE(cursor.exhausted());

        cursor.reset();
        EXPECT_FALSE(cursor.status().has_value());
        EXPECT_EQ(cursor.state(), Data::CursorState::Ready);
        ASSERT_TRUE(cursor.advance());
        EXPECT_EQ(*cursor.status(), 0U);
        EXPECT_EQ(cursor.current().inputs[0][0].item<float>(), 0.0F);
    }

    TEST(MinibatchCursor, RandomSelectLeavesStatusAndState)
    {
        auto cursor = make_cursor(1000, 100, /*shuffle=*/true);
        ASSERT_TRUE(cursor.advance());
        ASSERT_TRUE(cursor.advance());

        Random::Source other(99);
        for (int i = 0; i < 20; ++i) {
            cursor.random_select();
            cursor.random_select(other);
            EXPECT_EQ(*cursor.status(), 1U);
            EXPECT_EQ(cursor.state(), Data::CursorState::Ready);
            EXPECT_EQ(cursor.current().inputs.size(0), 10);
        }
        ASSERT_TRUE(cursor.advance());
        EXPECT_EQ(*cursor.status(), 2U);
    }

    TEST(MinibatchCursor, RemainderGoesToLastBatch)
    {
        auto cursor = make_cursor(10, 3, /*shuffle=*/false);
        EXPECT_EQ(cursor.batch_size(), 4);
        EXPECT_EQ(cursor.batch_count(), 3U);

        std::vector<std::int64_t> sizes;
        while (cursor.advance()) {
            sizes.push_back(cursor.current().inputs.size(0));
        }
        EXPECT_EQ(sizes, (std::vector<std::int64_t>{4, 4, 2}));
    }

    TEST(MinibatchCursor, ShuffledEpochCoversEverySampleOnce)
    {
        auto cursor = make_cursor(1000, 100, /*shuffle=*/true);
        EXPECT_TRUE(cursor.partition().shuffled());

        std::vector<torch::Tensor> seen;
        while (cursor.advance()) {
            seen.push_back(cursor.current().inputs.reshape({-1}));
        }
        ASSERT_EQ(seen.size(), 100U);
        const auto all = std::get<0>(torch::cat(seen).sort());
        EXPECT_TRUE(torch::equal(all, torch::arange(1000, torch::kFloat32)));
        EXPECT_FALSE(torch::equal(seen.front(), torch::arange(10, torch::kFloat32)));
    }

    TEST(MinibatchCursor, FeaturesAndLabelsStayAligned)
    {
        auto cursor = make_cursor(100, 10, /*shuffle=*/true);
        while (cursor.advance()) {
            const auto& batch = cursor.current();
            const auto expected = batch.inputs.reshape({-1}).to(torch::kLong).remainder(3);
            EXPECT_TRUE(torch::equal(batch.targets, expected));
        }
    }

    TEST(MinibatchCursor, InvalidDivisorIsConfigurationError)
    {
        EXPECT_THROW((void)make_cursor(10, 0, false), ConfigurationError);
        EXPECT_THROW((void)make_cursor(10, -2, false), ConfigurationError);
        EXPECT_THROW((void)make_cursor(10, 11, false), ConfigurationError);
        EXPECT_NO_THROW((void)make_cursor(10, 10, false));

        auto cursor = make_cursor(10, 5, false);
        EXPECT_THROW(cursor.resize(0), ConfigurationError);
        EXPECT_EQ(cursor.size_minibatch(), 5);
        EXPECT_EQ(cursor.batch_count(), 5U);
    }

    TEST(MinibatchCursor, ResizeRebuildsAndResets)
    {
        auto cursor = make_cursor(100, 10, false);
        ASSERT_TRUE(cursor.advance());

        cursor.resize(4);
        EXPECT_EQ(cursor.batch_size(), 25);
        EXPECT_EQ(cursor.batch_count(), 4U);
        EXPECT_FALSE(cursor.status().has_value());
        EXPECT_EQ(cursor.current().inputs.size(0), 25);
    }

    TEST(MinibatchCursor, ExplicitInitialBatchIsKept)
    {
        Data::CursorOptions options{};
        options.size_minibatch = 2;
        options.initial = Data::Batch{torch::full({1, 1}, 42.0F), torch::zeros({1}, torch::kLong)};
        Data::Cursor cursor(indexed_dataset(8), options, Random::Source(5));

        EXPECT_EQ(cursor.current().inputs.item<float>(), 42.0F);
        EXPECT_FALSE(cursor.status().has_value());
    }

    TEST(MinibatchCursor, ConvertCastsFeaturesButNotIndexLabels)
    {
        auto cursor = make_cursor(20, 4, false);
        cursor.convert(torch::kFloat64);
        EXPECT_EQ(cursor.dtype(), torch::kFloat64);
        EXPECT_EQ(cursor.current().inputs.scalar_type(), torch::kFloat64);
        EXPECT_EQ(cursor.current().targets.scalar_type(), torch::kLong);

        ASSERT_TRUE(cursor.advance());
        EXPECT_EQ(cursor.current().inputs.scalar_type(), torch::kFloat64);
    }
    TEST(MinibatchCursor, UnshuffledPartitionNeedsNoRandomSource)
    {
        const Data::Details::Partition partition(indexed_dataset(25), 4);
        EXPECT_EQ(partition.size(), 4U);
        EXPECT_EQ(partition.batch_size(), 7);

        const auto last = partition.batch(3, torch::kFloat64);
        EXPECT_EQ(last.inputs.scalar_type(), torch::kFloat64);
        EXPECT_TRUE(torch::equal(last.inputs.squeeze(1), torch::arange(21, 25, torch::kFloat64)));
        EXPECT_TRUE(torch::equal(partition.batch(0, torch::kFloat32).inputs.squeeze(1), torch::arange(0, 7, torch::kFloat32)));
        EXPECT_THROW((void)Data::Details::Partition(indexed_dataset(3), 4), ConfigurationError);
    }
}
