#include "safemeta/image_codec.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace safemeta {

using fixtures::Bytes;
using fixtures::view;

TEST(ImageCodec, JpegSplitsPixelAndMetadataSegments)
{
    const Bytes tiff = fixtures::sample_exif_tiff();
    const Bytes jpeg = fixtures::make_jpeg(
        {
            fixtures::jpeg_jfif_segment(),
            fixtures::jpeg_exif_segment(view(tiff)),
            fixtures::jpeg_adobe_segment(),
            fixtures::jpeg_comment_segment("shot on holiday"),
        },
        40, 30);

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(jpeg), &image), CodecStatus::Ok);
    EXPECT_EQ(image.format, ContainerFormat::Jpeg);
    EXPECT_EQ(image.canvas_width, 40U);
    EXPECT_EQ(image.canvas_height, 30U);

    ASSERT_EQ(image.metadata_parts.size(), 3U);
    EXPECT_EQ(image.metadata_parts[0].id, 0xFFE0U);
    EXPECT_EQ(image.metadata_parts[1].id, 0xFFE1U);
    EXPECT_EQ(image.metadata_parts[2].id, 0xFFFEU);

    // Adobe APP14, DQT, SOF0, SOS, entropy-coded data, EOI.
    ASSERT_EQ(image.pixel_parts.size(), 6U);
    EXPECT_EQ(image.pixel_parts[0].id, 0xFFEEU);
    EXPECT_EQ(image.pixel_parts[1].id, 0xFFDBU);
    EXPECT_EQ(image.pixel_parts[2].id, 0xFFC0U);
    EXPECT_EQ(image.pixel_parts[3].id, 0xFFDAU);
    EXPECT_EQ(image.pixel_parts[4].id, 0U);
    EXPECT_EQ(image.pixel_parts[5].id, 0xFFD9U);
}


TEST(ImageCodec, JpegEncodePlacesExifAfterSoi)
{
    const Bytes jpeg = fixtures::make_jpeg({ fixtures::jpeg_comment_segment("x") });
    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(jpeg), &image), CodecStatus::Ok);

    const Bytes exif = fixtures::bytes_of("MM");
    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, view(exif), &out),
              CodecStatus::Ok);

    ASSERT_GT(out.size(), 12U);
    EXPECT_EQ(out[0], std::byte { 0xFF });
    EXPECT_EQ(out[1], std::byte { 0xD8 });
    EXPECT_EQ(out[2], std::byte { 0xFF });
    EXPECT_EQ(out[3], std::byte { 0xE1 });
    EXPECT_EQ(out[4], std::byte { 0x00 });
    EXPECT_EQ(out[5], std::byte { static_cast<uint8_t>(8U + exif.size()) });
    EXPECT_EQ(out[6], std::byte { 'E' });
    EXPECT_EQ(out[9], std::byte { 'f' });
    EXPECT_EQ(out[10], std::byte { 0 });
    EXPECT_EQ(out[11], std::byte { 0 });
    EXPECT_FALSE(fixtures::contains(view(out), "\xFF\xFE"));
    EXPECT_EQ(out[out.size() - 2], std::byte { 0xFF });
    EXPECT_EQ(out[out.size() - 1], std::byte { 0xD9 });

    const std::vector<std::byte> pixels = pixel_payload_bytes(image);
    EXPECT_EQ(out.size(), 2U + 2U + 2U + 6U + exif.size() + pixels.size());
}


TEST(ImageCodec, JpegTrailingDataIsMetadata)
{
    Bytes jpeg = fixtures::make_jpeg({});
    fixtures::append_text(&jpeg, "TRAILER-DATA");

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(jpeg), &image), CodecStatus::Ok);
    ASSERT_EQ(image.metadata_parts.size(), 1U);
    EXPECT_EQ(image.metadata_parts[0].size, 12U);

    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, {}, &out), CodecStatus::Ok);
    EXPECT_FALSE(fixtures::contains(view(out), "TRAILER"));
    EXPECT_EQ(out[out.size() - 1], std::byte { 0xD9 });
}


TEST(ImageCodec, JpegWithoutFrameIsUndecodable)
{
    Bytes jpeg;
    fixtures::append_u8(&jpeg, 0xFF);
    fixtures::append_u8(&jpeg, 0xD8);
    fixtures::append_all(&jpeg, view(fixtures::jpeg_comment_segment("x")));
    fixtures::append_u8(&jpeg, 0xFF);
    fixtures::append_u8(&jpeg, 0xD9);

    DecodedImage image;
    EXPECT_EQ(default_image_codec().decode(view(jpeg), &image),
              CodecStatus::UndecodablePayload);

    Bytes truncated = fixtures::make_jpeg({});
    truncated.resize(truncated.size() - 2);
    EXPECT_EQ(default_image_codec().decode(view(truncated), &image),
              CodecStatus::UndecodablePayload);
}


TEST(ImageCodec, JpegExifSegmentSizeLimit)
{
    const Bytes jpeg = fixtures::make_jpeg({});
    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(jpeg), &image), CodecStatus::Ok);

    const Bytes huge(70000, std::byte { 0 });
    std::vector<std::byte> out;
    EXPECT_EQ(default_image_codec().encode(image, view(huge), &out),
              CodecStatus::EncodeFailure);
    EXPECT_TRUE(out.empty());
}


TEST(ImageCodec, PngKeepsCriticalChunksWithValidCrc)
{
    const Bytes tiff = fixtures::sample_exif_tiff();
    Bytes plte;
    for (int i = 0; i < 6; ++i) {
        plte.push_back(std::byte { static_cast<uint8_t>(i * 40) });
    }
    const Bytes png = fixtures::make_png(
        {
            fixtures::png_chunk("PLTE", view(plte)),
            fixtures::png_chunk("eXIf", view(tiff)),
            fixtures::png_text_chunk("Author", "Jane"),
        },
        { fixtures::png_chunk("tIME", view(Bytes(7, std::byte { 2 }))) });

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(png), &image), CodecStatus::Ok);
    EXPECT_EQ(image.canvas_width, 4U);
    EXPECT_EQ(image.canvas_height, 2U);
    EXPECT_EQ(image.metadata_parts.size(), 3U);
    EXPECT_EQ(image.pixel_parts.size(), 4U);

    const Bytes exif = fixtures::bytes_of("MM");
    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, view(exif), &out),
              CodecStatus::Ok);
    EXPECT_TRUE(fixtures::png_crcs_valid(view(out)));

    const std::vector<std::string> types = fixtures::png_chunk_types(view(out));
    const std::vector<std::string> expected = { "IHDR", "PLTE", "eXIf", "IDAT",
                                                "IEND" };
    EXPECT_EQ(types, expected);
}


TEST(ImageCodec, ApngReducesToDefaultImage)
{
    const Bytes actl(8, std::byte { 0 });
    const Bytes fctl(26, std::byte { 0 });
    const Bytes fdat(12, std::byte { 7 });
    const Bytes png = fixtures::make_png(
        {
            fixtures::png_chunk("acTL", view(actl)),
            fixtures::png_chunk("fcTL", view(fctl)),
        },
        {
            fixtures::png_chunk("fcTL", view(fctl)),
            fixtures::png_chunk("fdAT", view(fdat)),
        });

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(png), &image), CodecStatus::Ok);

    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, {}, &out), CodecStatus::Ok);
    const std::vector<std::string> types = fixtures::png_chunk_types(view(out));
    const std::vector<std::string> expected = { "IHDR", "IDAT", "IEND" };
    EXPECT_EQ(types, expected);
    EXPECT_TRUE(fixtures::png_crcs_valid(view(out)));
}


TEST(ImageCodec, PngStructureErrors)
{
    DecodedImage image;

    // First chunk must be IHDR.
    Bytes png = fixtures::make_png({});
    Bytes swapped(png.begin(), png.begin() + 8);
    fixtures::append_all(&swapped, view(fixtures::png_text_chunk("a", "b")));
    swapped.insert(swapped.end(), png.begin() + 8, png.end());
    EXPECT_EQ(default_image_codec().decode(view(swapped), &image),
              CodecStatus::UndecodablePayload);

    // Missing IEND.
    png.resize(png.size() - 12);
    EXPECT_EQ(default_image_codec().decode(view(png), &image),
              CodecStatus::UndecodablePayload);
}


TEST(ImageCodec, WebpSimpleBecomesExtended)
{
    const Bytes webp = fixtures::make_webp({ fixtures::webp_vp8_chunk(320, 200) });

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(webp), &image), CodecStatus::Ok);
    EXPECT_EQ(image.canvas_width, 320U);
    EXPECT_EQ(image.canvas_height, 200U);
    EXPECT_FALSE(image.has_alpha);

    const Bytes exif = fixtures::bytes_of("MMABC");
    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, view(exif), &out),
              CodecStatus::Ok);

    EXPECT_TRUE(fixtures::contains(std::span<const std::byte>(out).first(4),
                                   "RIFF"));
    EXPECT_EQ(fixtures::read_u32le_at(view(out), 4), out.size() - 8U);
    EXPECT_TRUE(fixtures::contains(
        std::span<const std::byte>(out).subspan(12, 4), "VP8X"));
    EXPECT_EQ(out[20], std::byte { 0x08 });
    // Canvas stored as width-1, height-1 (24-bit little-endian).
    EXPECT_EQ(out[24], std::byte { 63 });
    EXPECT_EQ(out[25], std::byte { 1 });
    EXPECT_EQ(out[27], std::byte { 199 });
    EXPECT_EQ((out.size() & 1U), 0U);

    // The VP8 bitstream is carried through byte for byte.
    const std::vector<std::byte> pixels = pixel_payload_bytes(image);
    ASSERT_EQ(pixels, fixtures::webp_vp8_chunk(320, 200));
    EXPECT_TRUE(std::equal(pixels.begin(), pixels.end(), out.begin() + 30));

    // EXIF chunk last, padded to even length.
    const size_t exif_at = 30U + pixels.size();
    EXPECT_TRUE(fixtures::contains(
        std::span<const std::byte>(out).subspan(exif_at, 4), "EXIF"));
    EXPECT_EQ(fixtures::read_u32le_at(view(out), exif_at + 4), exif.size());
}


TEST(ImageCodec, WebpAlphaFlagIsPreserved)
{
    const Bytes alph(9, std::byte { 3 });
    const Bytes tiff = fixtures::sample_exif_tiff();
    const Bytes webp = fixtures::make_webp({
        fixtures::webp_vp8x_chunk(0x10 | 0x08, 16, 16),
        fixtures::riff_chunk("ALPH", view(alph)),
        fixtures::webp_vp8_chunk(16, 16),
        fixtures::riff_chunk("EXIF", view(tiff)),
    });

    DecodedImage image;
    ASSERT_EQ(default_image_codec().decode(view(webp), &image), CodecStatus::Ok);
    EXPECT_TRUE(image.has_alpha);
    EXPECT_EQ(image.pixel_parts.size(), 2U);
    EXPECT_EQ(image.metadata_parts.size(), 2U);

    std::vector<std::byte> out;
    ASSERT_EQ(default_image_codec().encode(image, {}, &out), CodecStatus::Ok);
    EXPECT_EQ(out[20], std::byte { 0x10 });
    EXPECT_FALSE(fixtures::contains(view(out), "EXIF"));
}


TEST(ImageCodec, AnimatedWebpIsUnsupported)
{
    const Bytes anim(6, std::byte { 0 });
    const Bytes animated = fixtures::make_webp({
        fixtures::webp_vp8x_chunk(0x02, 16, 16),
        fixtures::riff_chunk("ANIM", view(anim)),
    });

    DecodedImage image;
    EXPECT_EQ(default_image_codec().decode(view(animated), &image),
              CodecStatus::UnsupportedFormat);

    const Bytes frames = fixtures::make_webp({
        fixtures::riff_chunk("ANMF", view(anim)),
    });
    EXPECT_EQ(default_image_codec().decode(view(frames), &image),
              CodecStatus::UnsupportedFormat);
}


TEST(ImageCodec, RejectsUnknownAndUnsupportedContainers)
{
    DecodedImage image;
    EXPECT_EQ(default_image_codec().decode(
                  view(fixtures::bytes_of("definitely not an image")), &image),
              CodecStatus::UnrecognizedFormat);
    EXPECT_EQ(default_image_codec().decode(
                  view(fixtures::bytes_of("GIF89a..........")), &image),
              CodecStatus::UnsupportedFormat);
    EXPECT_EQ(default_image_codec().decode(view(fixtures::sample_exif_tiff()),
                                           &image),
              CodecStatus::UnsupportedFormat);
    EXPECT_EQ(default_image_codec().decode(view(fixtures::make_jpeg({})),
                                           nullptr),
              CodecStatus::UndecodablePayload);

    std::vector<std::byte> out;
    EXPECT_EQ(default_image_codec().encode(DecodedImage {}, {}, &out),
              CodecStatus::UndecodablePayload);
}


TEST(ImageCodec, StatusNames)
{
    EXPECT_STREQ(codec_status_name(CodecStatus::UnsupportedFormat),
                 "unsupported_format");
    EXPECT_STREQ(codec_status_name(CodecStatus::EncodeFailure),
                 "encode_failure");
}

}  // namespace safemeta
