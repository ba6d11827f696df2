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

#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/key_range.hpp>
#include <chainstore/kv/table.hpp>
#include <chainstore/kv/write_batch.hpp>
#include <chainstore/test/temp_dir.hpp>

#include <boost/outcome/try.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace chainstore;
using namespace chainstore::test;

namespace
{
    // (group, n) -> text, keyed so that a group is a contiguous prefix
    struct NumberedTextTable
    {
        static constexpr Table table = Table::Operations;
        using key_type = std::pair<uint8_t, uint64_t>;
        using value_type = std::string;

        static byte_string encode_key(key_type const &key)
        {
            byte_string out;
            codec::encode_u8(out, key.first);
            codec::encode_u64(out, key.second);
            return out;
        }

        static Result<key_type> decode_key(byte_string_view enc)
        {
            BOOST_OUTCOME_TRY(auto const group, codec::decode_u8(enc));
            BOOST_OUTCOME_TRY(auto const n, codec::decode_u64(enc));
            BOOST_OUTCOME_TRY(codec::expect_end(enc));
            return key_type{group, n};
        }

        static byte_string encode_value(value_type const &value)
        {
            return byte_string{to_byte_string_view(value)};
        }

        static Result<value_type> decode_value(byte_string_view const enc)
        {
            if (enc == to_byte_string_view("bad")) {
                return StoreError::SerializationError;
            }
            return std::string{to_string_view(enc)};
        }
    };

    static_assert(Schema<NumberedTextTable>);

    byte_string group_prefix(uint8_t const group)
    {
        byte_string out;
        codec::encode_u8(out, group);
        return out;
    }
}

class IndexedStoreTest : public TempDirFixture
{
protected:
    std::unique_ptr<IndexedStore> store_;

    void SetUp() override
    {
        reopen();
    }

    void reopen()
    {
        store_.reset();
        auto res = IndexedStore::open(dir_ / "index");
        ASSERT_FALSE(res.has_error());
        store_ = std::move(res).value();
    }

    void put(uint8_t const group, uint64_t const n, std::string const &text)
    {
        WriteBatch batch;
        batch.put<NumberedTextTable>({group, n}, text);
        ASSERT_FALSE(store_->write(batch).has_error());
    }
};

TEST_F(IndexedStoreTest, get_missing_is_empty)
{
    auto const res = store_->get<NumberedTextTable>({1, 1});
    ASSERT_FALSE(res.has_error());
    EXPECT_FALSE(res.value().has_value());
}

TEST_F(IndexedStoreTest, batch_is_visible_after_write_and_reopen)
{
    WriteBatch batch;
    batch.put<NumberedTextTable>({1, 1}, "one");
    batch.put<NumberedTextTable>({1, 2}, "two");
    batch.put_raw(Table::Meta, byte_string{to_byte_string_view("k")}, {});
    EXPECT_EQ(batch.size(), 3);

    EXPECT_FALSE(store_->get<NumberedTextTable>({1, 2}).value().has_value());
    ASSERT_FALSE(store_->write(batch).has_error());
    EXPECT_EQ(store_->get<NumberedTextTable>({1, 2}).value(), "two");

    reopen();
    EXPECT_EQ(store_->get<NumberedTextTable>({1, 1}).value(), "one");
    auto const meta =
        store_->get_raw(Table::Meta, to_byte_string_view("k")).value();
    ASSERT_TRUE(meta.has_value());
    EXPECT_TRUE(meta->empty());
}

TEST_F(IndexedStoreTest, remove)
{
    put(1, 1, "one");
    WriteBatch batch;
    batch.remove<NumberedTextTable>({1, 1});
    ASSERT_FALSE(store_->write(batch).has_error());
    EXPECT_FALSE(store_->get<NumberedTextTable>({1, 1}).value().has_value());
}

TEST_F(IndexedStoreTest, iterate_prefix_in_key_order)
{
    put(2, 300, "c");
    put(1, 9, "x");
    put(2, 1, "a");
    put(2, 20, "b");
    put(3, 0, "y");

    auto const range =
        store_->iterate<NumberedTextTable>(KeyRange::prefix(group_prefix(2)));
    std::vector<std::string> seen;
    for (auto entry : range) {
        ASSERT_FALSE(entry.has_error());
        EXPECT_EQ(entry.value().first.first, 2);
        seen.push_back(entry.value().second);
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));

    // a second pass starts over
    auto const again = range.collect();
    ASSERT_FALSE(again.has_error());
    EXPECT_EQ(again.value().size(), 3);
}

TEST_F(IndexedStoreTest, iterate_empty_range)
{
    put(1, 1, "one");
    auto const entries =
        store_->iterate<NumberedTextTable>(KeyRange::prefix(group_prefix(7)))
            .collect();
    ASSERT_FALSE(entries.has_error());
    EXPECT_TRUE(entries.value().empty());
}

TEST_F(IndexedStoreTest, iterate_stops_at_decode_failure)
{
    put(1, 1, "one");
    put(1, 2, "bad");
    put(1, 3, "three");

    auto const range =
        store_->iterate<NumberedTextTable>(KeyRange::prefix(group_prefix(1)));
    size_t good = 0;
    size_t bad = 0;
    for (auto entry : range) {
        if (entry.has_error()) {
            EXPECT_EQ(entry.error(), StoreError::SerializationError);
            ++bad;
        }
        else {
            ++good;
        }
    }
    EXPECT_EQ(good, 1);
    EXPECT_EQ(bad, 1);

    auto const collected = range.collect();
    ASSERT_TRUE(collected.has_error());
    EXPECT_EQ(collected.error(), StoreError::SerializationError);
}

TEST_F(IndexedStoreTest, last_in_range)
{
    put(1, 5, "five");
    put(1, 7, "seven");
    put(2, 0, "other");

    auto const last =
        store_->last<NumberedTextTable>(KeyRange::prefix(group_prefix(1)));
    ASSERT_FALSE(last.has_error());
    ASSERT_TRUE(last.value().has_value());
    EXPECT_EQ(last.value()->first, (std::pair<uint8_t, uint64_t>{1, 7}));
    EXPECT_EQ(last.value()->second, "seven");

    // upper bound is exclusive
    KeyRange const below_seven{
        NumberedTextTable::encode_key({1, 0}),
        NumberedTextTable::encode_key({1, 7})};
    auto const before = store_->last<NumberedTextTable>(below_seven);
    ASSERT_FALSE(before.has_error());
    ASSERT_TRUE(before.value().has_value());
    EXPECT_EQ(before.value()->second, "five");

    auto const none =
        store_->last<NumberedTextTable>(KeyRange::prefix(group_prefix(9)));
    ASSERT_FALSE(none.has_error());
    EXPECT_FALSE(none.value().has_value());
}

TEST_F(IndexedStoreTest, snapshot_hides_later_writes)
{
    put(1, 1, "one");
    auto const snapshot = store_->snapshot();
    put(1, 2, "two");

    EXPECT_FALSE(store_->get<NumberedTextTable>({1, 2}, &snapshot)
                     .value()
                     .has_value());
    auto const entries = store_
                             ->iterate<NumberedTextTable>(
                                 KeyRange::prefix(group_prefix(1)), &snapshot)
                             .collect();
    ASSERT_FALSE(entries.has_error());
    EXPECT_EQ(entries.value().size(), 1);
    EXPECT_TRUE(
        store_->get<NumberedTextTable>({1, 2}).value().has_value());
}

TEST_F(IndexedStoreTest, flush_and_compact)
{
    for (uint64_t i = 0; i < 100; ++i) {
        put(1, i, std::to_string(i));
    }
    EXPECT_FALSE(store_->flush().has_error());
    EXPECT_FALSE(store_->compact().has_error());
    EXPECT_EQ(store_->get<NumberedTextTable>({1, 42}).value(), "42");
    EXPECT_FALSE(store_->stats().empty());
}

TEST(KeyRange, prefix_upper_bound)
{
    unsigned char const p[] = {0x01, 0xff, 0xff};
    auto const range = KeyRange::prefix(byte_string{p, sizeof(p)});
    ASSERT_TRUE(range.upper.has_value());
    EXPECT_EQ(*range.upper, byte_string(1, 0x02));

    unsigned char const all_ff[] = {0xff};
    EXPECT_FALSE(KeyRange::prefix(byte_string{all_ff, 1}).upper.has_value());

    EXPECT_TRUE(range.contains(byte_string{p, sizeof(p)}));
    unsigned char const outside[] = {0x02};
    EXPECT_FALSE(range.contains(byte_string_view{outside, 1}));
}
