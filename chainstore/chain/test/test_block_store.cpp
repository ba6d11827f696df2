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
#include <chainstore/chain/block_metadata.hpp>
#include <chainstore/chain/block_store.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/test/chain_builder.hpp>
#include <chainstore/test/storage_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace chainstore;
using namespace chainstore::test;

namespace
{
    byte_string operation_bytes(uint32_t const index)
    {
        std::string const text = "operation #" + std::to_string(index);
        return byte_string{to_byte_string_view(text)};
    }

    std::set<BlockHash>
    collect_hashes(TableRange<BlockLevelsTable> const &range)
    {
        std::set<BlockHash> hashes;
        for (auto entry : range) {
            EXPECT_FALSE(entry.has_error());
            if (entry.has_value()) {
                hashes.insert(entry.value().first.second);
            }
        }
        return hashes;
    }
}

class BlockStoreTest : public StorageFixture
{
protected:
    BlockStore &blocks()
    {
        return storage_->blocks();
    }

    BlockMetadata metadata(BlockHash const &hash)
    {
        auto const res = blocks().get_block_metadata(hash);
        EXPECT_FALSE(res.has_error());
        EXPECT_TRUE(res.value().has_value());
        return res.value().value_or(BlockMetadata{});
    }
};

TEST_F(BlockStoreTest, put_and_get_block)
{
    auto const chain = make_chain(2);
    put_all(chain);

    auto const stored = blocks().get_block(chain[1].hash);
    ASSERT_FALSE(stored.has_error());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->hash, chain[1].hash);
    EXPECT_EQ(stored.value()->header, chain[1].header);

    auto const bytes = blocks().get_block_bytes(chain[1].hash);
    ASSERT_FALSE(bytes.has_error());
    EXPECT_EQ(bytes.value(), raw_bytes(chain[1]));

    EXPECT_TRUE(blocks().contains(chain[2].hash).value());
    auto const missing = make_block(chain[2], 5);
    EXPECT_FALSE(blocks().contains(missing.hash).value());
    EXPECT_FALSE(blocks().get_block(missing.hash).value().has_value());
    EXPECT_FALSE(blocks().get_block_bytes(missing.hash).value().has_value());
}

TEST_F(BlockStoreTest, metadata_tracks_chain_position)
{
    auto const chain = make_chain(2);
    put_all(chain);
    auto const sibling = make_block(chain[1], 3);
    put(sibling);

    auto const genesis = metadata(chain[0].hash);
    EXPECT_EQ(genesis.level, 0);
    EXPECT_EQ(genesis.predecessor, std::nullopt);
    EXPECT_EQ(genesis.status, ValidationStatus::Unknown);
    EXPECT_FALSE(genesis.on_main_chain);

    auto const parent = metadata(chain[1].hash);
    EXPECT_EQ(parent.level, 1);
    EXPECT_EQ(parent.predecessor, chain[0].hash);
    EXPECT_EQ(
        parent.successors,
        (std::vector<BlockHash>{chain[2].hash, sibling.hash}));
}

TEST_F(BlockStoreTest, duplicate_block_is_rejected)
{
    auto const chain = make_chain(1);
    put_all(chain);
    auto const res =
        blocks().put_block(*writer_, chain[1], raw_bytes(chain[1]));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::DuplicateKey);
    // the parent did not gain a second successor entry
    EXPECT_EQ(metadata(chain[0].hash).successors.size(), 1);
}

TEST_F(BlockStoreTest, unknown_predecessor)
{
    auto const chain = make_chain(2);
    put(chain[0]);
    auto const res =
        blocks().put_block(*writer_, chain[2], raw_bytes(chain[2]));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::NotFound);
    EXPECT_FALSE(blocks().contains(chain[2].hash).value());
}

TEST_F(BlockStoreTest, inconsistent_level)
{
    auto const chain = make_chain(1);
    put_all(chain);

    auto bad = make_block(chain[1]);
    bad.header.level = 5;
    auto const res = blocks().put_block(*writer_, bad, raw_bytes(bad));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::InvalidBlock);

    auto bad_genesis = make_block(std::nullopt, 4);
    bad_genesis.header.level = 1;
    auto const res2 =
        blocks().put_block(*writer_, bad_genesis, raw_bytes(bad_genesis));
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.error(), StoreError::InvalidBlock);
}

TEST_F(BlockStoreTest, validation_status)
{
    auto const chain = make_chain(1);
    put_all(chain);
    ASSERT_FALSE(blocks()
                     .update_validation_status(
                         *writer_, chain[1].hash, ValidationStatus::Applied)
                     .has_error());
    EXPECT_EQ(metadata(chain[1].hash).status, ValidationStatus::Applied);

    auto const res = blocks().update_validation_status(
        *writer_, make_block(chain[1], 9).hash, ValidationStatus::Invalid);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::NotFound);
}

TEST_F(BlockStoreTest, operations)
{
    auto const chain = make_chain(1);
    put_all(chain);
    auto const &block = chain[1].hash;

    // stored out of order, read back in index order
    for (uint32_t index : {2u, 0u, 1u, 10u}) {
        ASSERT_FALSE(blocks()
                         .put_operation(
                             *writer_, block, index, operation_bytes(index))
                         .has_error());
    }

    auto const one = blocks().get_operation(block, 1);
    ASSERT_FALSE(one.has_error());
    ASSERT_TRUE(one.value().has_value());
    EXPECT_EQ(one.value()->data, operation_bytes(1));
    EXPECT_FALSE(blocks().get_operation(block, 3).value().has_value());

    auto const all = blocks().get_operations(block);
    ASSERT_FALSE(all.has_error());
    ASSERT_EQ(all.value().size(), 4);
    std::vector<uint32_t> indices;
    for (auto const &op : all.value()) {
        EXPECT_EQ(op.block, block);
        EXPECT_EQ(op.data, operation_bytes(op.index));
        indices.push_back(op.index);
    }
    EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 10}));

    EXPECT_TRUE(blocks().get_operations(chain[0].hash).value().empty());
}

TEST_F(BlockStoreTest, operation_status)
{
    auto const chain = make_chain(1);
    put_all(chain);
    auto const &block = chain[1].hash;

    ASSERT_FALSE(blocks()
                     .put_operation(*writer_, block, 0, operation_bytes(0))
                     .has_error());
    ASSERT_FALSE(blocks()
                     .put_operation(
                         *writer_,
                         block,
                         1,
                         operation_bytes(1),
                         ValidationStatus::Applied)
                     .has_error());

    auto const first = blocks().get_operation(block, 0);
    ASSERT_FALSE(first.has_error());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->meta.status, ValidationStatus::Unknown);

    ASSERT_FALSE(blocks()
                     .update_operation_status(
                         *writer_, block, 0, ValidationStatus::Invalid)
                     .has_error());
    reopen();

    auto const all = blocks().get_operations(block);
    ASSERT_FALSE(all.has_error());
    ASSERT_EQ(all.value().size(), 2);
    EXPECT_EQ(all.value()[0].meta.status, ValidationStatus::Invalid);
    EXPECT_EQ(all.value()[0].data, operation_bytes(0));
    EXPECT_EQ(all.value()[1].meta.status, ValidationStatus::Applied);
    EXPECT_EQ(all.value()[1].data, operation_bytes(1));

    auto const missing = blocks().update_operation_status(
        *writer_, block, 7, ValidationStatus::Applied);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), StoreError::NotFound);
}

TEST(OperationMetadataCodec, rejects_unknown_status)
{
    byte_string enc;
    encode_operation_metadata(
        enc, OperationMetadata{.status = ValidationStatus::Applied});
    byte_string_view view{enc};
    auto const meta = decode_operation_metadata(view);
    ASSERT_FALSE(meta.has_error());
    EXPECT_EQ(meta.value().status, ValidationStatus::Applied);
    EXPECT_TRUE(view.empty());

    byte_string const bad{0x07};
    byte_string_view bad_view{bad};
    auto const res = decode_operation_metadata(bad_view);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::SerializationError);
}

TEST_F(BlockStoreTest, operation_errors)
{
    auto const chain = make_chain(1);
    put_all(chain);

    ASSERT_FALSE(
        blocks()
            .put_operation(*writer_, chain[1].hash, 0, operation_bytes(0))
            .has_error());
    auto const dup = blocks().put_operation(
        *writer_, chain[1].hash, 0, operation_bytes(0));
    ASSERT_TRUE(dup.has_error());
    EXPECT_EQ(dup.error(), StoreError::DuplicateKey);

    auto const orphan = blocks().put_operation(
        *writer_, make_block(chain[1], 8).hash, 0, operation_bytes(0));
    ASSERT_TRUE(orphan.has_error());
    EXPECT_EQ(orphan.error(), StoreError::NotFound);
}

TEST_F(BlockStoreTest, level_queries)
{
    auto const chain = make_chain(5);
    put_all(chain);
    auto const fork = make_branch(chain[2], 2, 4);
    put_all(fork);

    EXPECT_EQ(
        collect_hashes(blocks().blocks_at_level(3)),
        (std::set<BlockHash>{chain[3].hash, fork[0].hash}));
    EXPECT_EQ(
        collect_hashes(blocks().blocks_at_level(5)),
        std::set<BlockHash>{chain[5].hash});
    EXPECT_TRUE(collect_hashes(blocks().blocks_at_level(6)).empty());

    auto const range = blocks().blocks_in_levels(2, 5);
    auto const entries = range.collect();
    ASSERT_FALSE(entries.has_error());
    ASSERT_EQ(entries.value().size(), 5);
    uint64_t prev_level = 2;
    for (auto const &[key, value] : entries.value()) {
        EXPECT_GE(key.first, prev_level);
        EXPECT_LT(key.first, 5);
        prev_level = key.first;
    }

    auto const inverted = blocks().blocks_in_levels(5, 2).collect();
    ASSERT_FALSE(inverted.has_error());
    EXPECT_TRUE(inverted.value().empty());
    EXPECT_TRUE(blocks().blocks_in_levels(3, 3).collect().value().empty());
}

TEST_F(BlockStoreTest, main_chain_switch)
{
    // G <- B1 <- B2 <- B3 <- B4
    //              \- C3 <- C4 <- C5
    auto const chain = make_chain(4);
    put_all(chain);
    auto const fork = make_branch(chain[2], 3, 6);
    put_all(fork);

    EXPECT_EQ(blocks().main_chain_head().value(), std::nullopt);
    ASSERT_FALSE(
        blocks().set_main_chain_head(*writer_, chain[4].hash).has_error());
    EXPECT_EQ(blocks().main_chain_head().value(), chain[4].hash);
    for (auto const &block : chain) {
        EXPECT_TRUE(metadata(block.hash).on_main_chain);
    }
    for (auto const &block : fork) {
        EXPECT_FALSE(metadata(block.hash).on_main_chain);
    }

    ASSERT_FALSE(
        blocks().set_main_chain_head(*writer_, fork.back().hash).has_error());
    EXPECT_EQ(blocks().main_chain_head().value(), fork.back().hash);
    for (size_t i = 0; i <= 2; ++i) {
        EXPECT_TRUE(metadata(chain[i].hash).on_main_chain);
    }
    EXPECT_FALSE(metadata(chain[3].hash).on_main_chain);
    EXPECT_FALSE(metadata(chain[4].hash).on_main_chain);
    for (auto const &block : fork) {
        EXPECT_TRUE(metadata(block.hash).on_main_chain);
    }

    // moving back to an ancestor only clears the branch above it
    ASSERT_FALSE(
        blocks().set_main_chain_head(*writer_, chain[1].hash).has_error());
    EXPECT_TRUE(metadata(chain[1].hash).on_main_chain);
    EXPECT_FALSE(metadata(chain[2].hash).on_main_chain);
    for (auto const &block : fork) {
        EXPECT_FALSE(metadata(block.hash).on_main_chain);
    }

    reopen();
    EXPECT_EQ(storage_->blocks().main_chain_head().value(), chain[1].hash);
}

TEST_F(BlockStoreTest, main_chain_head_must_exist)
{
    auto const res = blocks().set_main_chain_head(
        *writer_, make_block(std::nullopt, 1).hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::NotFound);
}

TEST(BlockMetadataCodec, rejects_unknown_status)
{
    BlockMetadata meta;
    meta.successors.resize(2);
    auto enc = encode_block_metadata(meta);
    byte_string_view view{enc};
    auto const decoded = decode_block_metadata(view);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), meta);

    enc[0] = 7;
    byte_string_view bad{enc};
    auto const res = decode_block_metadata(bad);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::SerializationError);
}
