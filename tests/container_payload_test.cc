#include "safemeta/container_payload.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace safemeta {

using fixtures::Bytes;
using fixtures::view;

namespace {

    static Bytes sample_text(size_t n)
    {
        Bytes out;
        for (size_t i = 0; i < n; ++i) {
            out.push_back(std::byte { static_cast<uint8_t>('a' + (i % 26)) });
        }
        return out;
    }


    static ContainerBlockRef whole_block(const Bytes& bytes,
                                         BlockCompression compression)
    {
        ContainerBlockRef block;
        block.compression = compression;
        block.data_offset = 0;
        block.data_size   = bytes.size();
        return block;
    }

}  // namespace

TEST(ContainerPayload, CopiesUncompressedBlocks)
{
    const Bytes file = fixtures::bytes_of("xxhello-worldyy");
    ContainerBlockRef block;
    block.data_offset = 2;
    block.data_size   = 11;

    std::vector<std::byte> out;
    const PayloadResult r = extract_payload(view(file), block, &out);
    EXPECT_EQ(r.status, PayloadStatus::Ok);
    EXPECT_EQ(r.written, 11U);
    EXPECT_EQ(out, fixtures::bytes_of("hello-world"));
}


TEST(ContainerPayload, InflatesDeflateBlocks)
{
    const Bytes plain      = sample_text(50000);
    const Bytes compressed = fixtures::zlib_compress(view(plain));
    ASSERT_FALSE(compressed.empty());

    std::vector<std::byte> out;
    const PayloadResult r = extract_payload(
        view(compressed), whole_block(compressed, BlockCompression::Deflate),
        &out);
    EXPECT_EQ(r.status, PayloadStatus::Ok);
    EXPECT_EQ(r.written, plain.size());
    EXPECT_EQ(out, plain);
}


TEST(ContainerPayload, InflateOutputLimit)
{
    const Bytes plain      = sample_text(50000);
    const Bytes compressed = fixtures::zlib_compress(view(plain));

    PayloadOptions options;
    options.limits.max_output_bytes = 1000;

    std::vector<std::byte> out;
    const PayloadResult r = extract_payload(
        view(compressed), whole_block(compressed, BlockCompression::Deflate),
        &out, options);
    EXPECT_EQ(r.status, PayloadStatus::LimitExceeded);
    EXPECT_LE(out.size(), 1000U);

    const PayloadResult copy = extract_payload(
        view(plain), whole_block(plain, BlockCompression::None), &out, options);
    EXPECT_EQ(copy.status, PayloadStatus::LimitExceeded);
}


TEST(ContainerPayload, TruncatedDeflateStreamIsMalformed)
{
    const Bytes plain = sample_text(4000);
    Bytes compressed  = fixtures::zlib_compress(view(plain));
    ASSERT_GT(compressed.size(), 16U);
    compressed.resize(compressed.size() / 2U);

    std::vector<std::byte> out;
    const PayloadResult r = extract_payload(
        view(compressed), whole_block(compressed, BlockCompression::Deflate),
        &out);
    EXPECT_EQ(r.status, PayloadStatus::Malformed);

    const Bytes garbage = fixtures::bytes_of("not a zlib stream");
    EXPECT_EQ(extract_payload(view(garbage),
                              whole_block(garbage, BlockCompression::Deflate),
                              &out)
                  .status,
              PayloadStatus::Malformed);
}


TEST(ContainerPayload, RejectsOutOfRangeBlocks)
{
    const Bytes file = fixtures::bytes_of("abcdef");
    ContainerBlockRef block;
    block.data_offset = 4;
    block.data_size   = 10;

    std::vector<std::byte> out;
    EXPECT_EQ(extract_payload(view(file), block, &out).status,
              PayloadStatus::Malformed);
    EXPECT_EQ(extract_payload(view(file), block, nullptr).status,
              PayloadStatus::Malformed);
}


TEST(ContainerPayload, DecodesRawProfileHex)
{
    const Bytes payload = sample_text(100);
    const std::string text = fixtures::raw_profile_text("exif", view(payload));

    std::vector<std::byte> out;
    const PayloadResult r = decode_raw_profile_text(
        view(fixtures::bytes_of(text)), &out);
    EXPECT_EQ(r.status, PayloadStatus::Ok);
    EXPECT_EQ(out, payload);
}


TEST(ContainerPayload, RawProfileLengthMismatchIsMalformed)
{
    // Declares five bytes, carries four.
    const Bytes text = fixtures::bytes_of("\nexif\n       5\n4142\n4344\n");
    std::vector<std::byte> out;
    EXPECT_EQ(decode_raw_profile_text(view(text), &out).status,
              PayloadStatus::Malformed);

    const Bytes bad_hex = fixtures::bytes_of("\nexif\n       2\nzz11\n");
    EXPECT_EQ(decode_raw_profile_text(view(bad_hex), &out).status,
              PayloadStatus::Malformed);

    const Bytes no_length = fixtures::bytes_of("\nexif\n\n4142\n");
    EXPECT_EQ(decode_raw_profile_text(view(no_length), &out).status,
              PayloadStatus::Malformed);
}


TEST(ContainerPayload, StatusNames)
{
    EXPECT_STREQ(payload_status_name(PayloadStatus::Ok), "ok");
    EXPECT_STREQ(payload_status_name(PayloadStatus::LimitExceeded),
                 "limit_exceeded");
}

}  // namespace safemeta
