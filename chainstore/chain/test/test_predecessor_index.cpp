// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <chainstore/chain/block_header.hpp>
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/test/chain_builder.hpp>
#include <chainstore/test/storage_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <vector>

using namespace chainstore;
using namespace chainstore::test;

class PredecessorIndexTest : public StorageFixture
{
protected:
    PredecessorIndex const &index() const
    {
        return storage_->predecessors();
    }

    BlockHash ancestor(BlockHash const &block, int64_t const distance) const
    {
        auto const res = index().ancestor_at(block, distance);
        EXPECT_FALSE(res.has_error());
        return res.has_error() ? BlockHash{} : res.value();
    }

    std::optional<BlockHash> entry(BlockHash const &block, uint8_t const i)
    {
        auto const res = index().entry(block, i);
        EXPECT_FALSE(res.has_error());
        return res.has_error() ? std::nullopt : res.value();
    }
};

// G <- B1 <- ... <- B8
TEST_F(PredecessorIndexTest, eight_blocks)
{
    auto const chain = make_chain(8);
    put_all(chain);
    auto const &b8 = chain[8].hash;

    EXPECT_EQ(ancestor(b8, 0), b8);
    EXPECT_EQ(ancestor(b8, 5), chain[3].hash);
    EXPECT_EQ(ancestor(b8, 8), chain[0].hash);

    EXPECT_EQ(entry(b8, 0), chain[7].hash);
    EXPECT_EQ(entry(b8, 1), chain[6].hash);
    EXPECT_EQ(entry(b8, 2), chain[4].hash);
    EXPECT_EQ(entry(b8, 3), chain[0].hash);
    EXPECT_EQ(entry(b8, 4), std::nullopt);

    // genesis has no entries
    EXPECT_EQ(entry(chain[0].hash, 0), std::nullopt);
    // 2^1 > 1
    EXPECT_EQ(entry(chain[1].hash, 1), std::nullopt);
}

TEST_F(PredecessorIndexTest, ancestor_matches_predecessor_walk)
{
    auto const chain = make_chain(300);
    put_all(chain);

    for (size_t level : {1ul, 2ul, 7ul, 64ul, 129ul, 255ul, 256ul, 300ul}) {
        auto const &block = chain[level].hash;
        for (size_t d = 0; d <= level; ++d) {
            ASSERT_EQ(
                ancestor(block, static_cast<int64_t>(d)),
                chain[level - d].hash)
                << "level " << level << " distance " << d;
        }
    }
}

TEST_F(PredecessorIndexTest, every_block_reaches_genesis)
{
    auto const chain = make_chain(40);
    put_all(chain);
    for (auto const &block : chain) {
        EXPECT_EQ(
            ancestor(block.hash, static_cast<int64_t>(block.header.level)),
            chain[0].hash);
    }
}

TEST_F(PredecessorIndexTest, invalid_distance)
{
    auto const chain = make_chain(8);
    put_all(chain);

    auto const past_genesis = index().ancestor_at(chain[8].hash, 9);
    ASSERT_TRUE(past_genesis.has_error());
    EXPECT_EQ(past_genesis.error(), StoreError::InvalidDistance);

    auto const negative = index().ancestor_at(chain[8].hash, -1);
    ASSERT_TRUE(negative.has_error());
    EXPECT_EQ(negative.error(), StoreError::InvalidDistance);

    auto const from_genesis = index().ancestor_at(chain[0].hash, 1);
    ASSERT_TRUE(from_genesis.has_error());
    EXPECT_EQ(from_genesis.error(), StoreError::InvalidDistance);
}

TEST_F(PredecessorIndexTest, unknown_block)
{
    auto const res = index().ancestor_at(make_block(std::nullopt, 99).hash, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::NotFound);
}

// G <- B1 <- B2 <- B3 <- B4 ... B8
//                     \- B4'
TEST_F(PredecessorIndexTest, fork)
{
    auto const chain = make_chain(8);
    put_all(chain);
    auto const b4_fork = make_block(chain[3], 1);
    put(b4_fork);
    ASSERT_NE(b4_fork.hash, chain[4].hash);

    EXPECT_EQ(ancestor(b4_fork.hash, 3), chain[1].hash);
    EXPECT_EQ(ancestor(b4_fork.hash, 4), chain[0].hash);
    EXPECT_EQ(entry(b4_fork.hash, 0), chain[3].hash);
    EXPECT_EQ(entry(b4_fork.hash, 2), chain[0].hash);

    // the main branch is untouched
    EXPECT_EQ(ancestor(chain[8].hash, 5), chain[3].hash);
    EXPECT_EQ(entry(chain[4].hash, 0), chain[3].hash);
}

TEST_F(PredecessorIndexTest, common_ancestor)
{
    auto const chain = make_chain(20);
    put_all(chain);
    auto const branch = make_branch(chain[6], 30, 7);
    put_all(branch);

    auto const fork_point =
        index().common_ancestor(chain[20].hash, branch.back().hash);
    ASSERT_FALSE(fork_point.has_error());
    EXPECT_EQ(fork_point.value(), chain[6].hash);

    auto const same_branch =
        index().common_ancestor(chain[3].hash, chain[17].hash);
    ASSERT_FALSE(same_branch.has_error());
    EXPECT_EQ(same_branch.value(), chain[3].hash);

    auto const itself = index().common_ancestor(chain[9].hash, chain[9].hash);
    ASSERT_FALSE(itself.has_error());
    EXPECT_EQ(itself.value(), chain[9].hash);

    auto const siblings =
        index().common_ancestor(chain[7].hash, branch.front().hash);
    ASSERT_FALSE(siblings.has_error());
    EXPECT_EQ(siblings.value(), chain[6].hash);
}

TEST_F(PredecessorIndexTest, common_ancestor_of_distinct_roots)
{
    auto const a = make_chain(5, 1);
    auto const b = make_chain(3, 2);
    put_all(a);
    put_all(b);
    auto const res = index().common_ancestor(a.back().hash, b.back().hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::NotFound);
}

TEST_F(PredecessorIndexTest, entries_survive_reopen)
{
    auto const chain = make_chain(16);
    put_all(chain);
    reopen();
    EXPECT_EQ(entry(chain[16].hash, 4), chain[0].hash);
    EXPECT_EQ(ancestor(chain[16].hash, 11), chain[5].hash);
}
