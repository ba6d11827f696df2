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

#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/log/compression.hpp>

#include <brotli/decode.h>
#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>

CHAINSTORE_NAMESPACE_BEGIN

Result<byte_string> brotli_compress(byte_string_view const input)
{
    size_t out_size = BrotliEncoderMaxCompressedSize(input.size());
    if (out_size == 0) {
        return StoreError::IoFailure;
    }
    byte_string out;
    out.resize(out_size);
    auto const result = BrotliEncoderCompress(
        BROTLI_DEFAULT_QUALITY,
        BROTLI_DEFAULT_WINDOW,
        BROTLI_MODE_GENERIC,
        input.size(),
        input.data(),
        &out_size,
        out.data());
    if (result != BROTLI_TRUE) {
        return StoreError::IoFailure;
    }
    out.resize(out_size);
    return out;
}

Result<byte_string> brotli_decompress(byte_string_view const view)
{
    byte_string out;
    size_t out_size = 0;
    size_t available_in = view.size();
    size_t available_out = available_in * 5 + 64;
    out.resize(available_out);
    BrotliDecoderResult result;
    std::unique_ptr<BrotliDecoderState, void (*)(BrotliDecoderState *)> state{
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr),
        BrotliDecoderDestroyInstance};
    if (!state) {
        return StoreError::IoFailure;
    }
    uint8_t const *next_in = view.data();
    do {
        uint8_t *next_out = &out.data()[out_size];
        result = BrotliDecoderDecompressStream(
            state.get(),
            &available_in,
            &next_in,
            &available_out,
            &next_out,
            &out_size);
        if (result != BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
            break;
        }
        // output buffer full, double it
        available_out += out.size();
        out.resize(2 * out.size());
    }
    while (true);
    if (result != BROTLI_DECODER_RESULT_SUCCESS) {
        return StoreError::Corrupted;
    }
    out.resize(out_size);
    return out;
}

CHAINSTORE_NAMESPACE_END
