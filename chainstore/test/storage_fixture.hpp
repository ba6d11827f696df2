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

#pragma once

#include <chainstore/chain/block_header.hpp>
#include <chainstore/chain/chain_writer.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/storage/storage.hpp>
#include <chainstore/storage/storage_config.hpp>
#include <chainstore/test/chain_builder.hpp>
#include <chainstore/test/temp_dir.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <utility>

CHAINSTORE_NAMESPACE_BEGIN

namespace test
{
    class StorageFixture : public TempDirFixture
    {
    protected:
        StorageConfig config_{};
        std::unique_ptr<Storage> storage_;
        ChainWriter *writer_{nullptr};

        void SetUp() override
        {
            reopen();
        }

        void TearDown() override
        {
            writer_ = nullptr;
            storage_.reset();
            TempDirFixture::TearDown();
        }

        void close()
        {
            writer_ = nullptr;
            storage_.reset();
        }

        void reopen()
        {
            close();
            auto res = Storage::open(dir_, config_);
            ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
            storage_ = std::move(res).value();
            writer_ = &storage_->writer();
        }

        void put(BlockHeaderWithHash const &block)
        {
            auto const res = storage_->blocks().put_block(
                *writer_, block, raw_bytes(block));
            ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
        }

        void put_all(std::span<BlockHeaderWithHash const> const blocks)
        {
            for (auto const &block : blocks) {
                put(block);
            }
        }
    };
}

CHAINSTORE_NAMESPACE_END
