#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include <laminar/context.hpp>
#include <laminar/lamexcept.hpp>

#include "communication/distributed_context.hpp"
#include "communication/local_context.hpp"

// Test that there are no errors constructing a distributed_context from a local_context
TEST(local_context, construct_distributed_context)
{
    lam::distributed_context ctx = lam::local_context();
    EXPECT_EQ("local", ctx.name());
}

TEST(local_context, size_rank)
{
    lam::local_context ctx;

    EXPECT_EQ(ctx.size(), 1);
    EXPECT_EQ(ctx.id(), 0);
}

TEST(local_context, collectives)
{
    lam::distributed_context ctx;

    EXPECT_EQ(1., ctx.min(1.));
    EXPECT_EQ(1., ctx.max(1.));
    EXPECT_EQ(42., ctx.sum(42.));

    std::uint32_t one32 = 1;
    EXPECT_EQ(one32, ctx.min(one32));
    EXPECT_EQ(one32, ctx.sum(one32));

    std::uint64_t n = 1234567890123;
    EXPECT_EQ(n, ctx.max(n));
    EXPECT_EQ(n, ctx.sum(n));

    EXPECT_EQ(std::vector<double>{42}, ctx.gather(42., 0));
}

TEST(partition_context, collectives)
{
    auto ctx = lam::make_partition_context(2, 5);

    EXPECT_EQ(2, ctx->id());
    EXPECT_EQ(5, ctx->size());
    EXPECT_EQ("partition", ctx->name());

    // No communication: reductions see the local value only.
    std::uint64_t n = 7;
    EXPECT_EQ(n, ctx->sum(n));
    EXPECT_EQ(3., ctx->max(3.));
    EXPECT_EQ(std::vector<std::uint32_t>{9}, ctx->gather(std::uint32_t(9), 0));

    EXPECT_THROW(lam::make_partition_context(5, 5), lam::bad_partition);
    EXPECT_THROW(lam::make_partition_context(0, 0), lam::bad_partition);
}

TEST(context, queries)
{
    auto local = lam::make_context();
    EXPECT_EQ(1u, lam::num_ranks(local));
    EXPECT_EQ(0u, lam::rank(local));
    EXPECT_FALSE(lam::has_mpi(local));
    EXPECT_EQ("local", lam::distribution_type(local));

    auto part = lam::make_context(lam::partition_info{3, 4});
    EXPECT_EQ(4u, lam::num_ranks(part));
    EXPECT_EQ(3u, lam::rank(part));
    EXPECT_FALSE(lam::has_mpi(part));
    EXPECT_EQ("partition", lam::distribution_type(part));
}
