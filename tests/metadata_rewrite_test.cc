#include "safemeta/metadata_rewrite.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace safemeta {

using fixtures::Bytes;
using fixtures::view;

namespace {

    class FailingEncodeCodec final : public ImageCodec {
    public:
        CodecStatus decode(std::span<const std::byte> bytes,
                           DecodedImage* out) const noexcept override
        {
            return default_image_codec().decode(bytes, out);
        }

        CodecStatus encode(const DecodedImage&, std::span<const std::byte>,
                           std::vector<std::byte>* out) const noexcept override
        {
            out->push_back(std::byte { 0xAA });
            return CodecStatus::EncodeFailure;
        }
    };


    static Bytes camera_jpeg()
    {
        const Bytes tiff = fixtures::sample_exif_tiff();
        return fixtures::make_jpeg(
            {
                fixtures::jpeg_jfif_segment(),
                fixtures::jpeg_exif_segment(view(tiff)),
                fixtures::jpeg_xmp_segment(fixtures::sample_xmp("Nikon")),
                fixtures::jpeg_comment_segment("taken at home"),
            },
            40, 30);
    }


    static size_t count_exif_blocks(std::span<const std::byte> bytes)
    {
        std::vector<ContainerBlockRef> blocks(32);
        const ScanResult r = scan_auto(bytes, blocks);
        size_t n           = 0;
        for (size_t i = 0; i < r.written; ++i) {
            if (blocks[i].kind == ContainerBlockKind::Exif) {
                ++n;
            }
        }
        return n;
    }

}  // namespace

TEST(MetadataRewrite, JpegStripRemovesSensitiveData)
{
    const Bytes jpeg = camera_jpeg();
    const StripResult r = strip_metadata(view(jpeg));

    EXPECT_EQ(r.rewrite.status, RewriteStatus::Ok);
    EXPECT_FALSE(r.used_fallback);
    EXPECT_EQ(r.rewrite.format, ContainerFormat::Jpeg);
    EXPECT_EQ(r.rewrite.removed_blocks, 4U);
    EXPECT_EQ(r.rewrite.exif_bytes, 132U);

    EXPECT_TRUE(r.analysis.has_gps_data);
    EXPECT_TRUE(r.analysis.has_exact_location);
    EXPECT_TRUE(r.analysis.has_device_info);
    EXPECT_TRUE(r.analysis.has_timestamps);

    const std::span<const std::byte> out = view(r.bytes);
    EXPECT_FALSE(fixtures::contains(out, "Canon"));
    EXPECT_FALSE(fixtures::contains(out, "Nikon"));
    EXPECT_FALSE(fixtures::contains(out, "Firmware"));
    EXPECT_FALSE(fixtures::contains(out, "2024:05:01"));
    EXPECT_FALSE(fixtures::contains(out, "taken at home"));
    EXPECT_FALSE(fixtures::contains(out, "xmpmeta"));
    EXPECT_FALSE(fixtures::contains(out, "JFIF"));
    EXPECT_EQ(count_exif_blocks(out), 1U);

    const MetadataReadResult after = read_metadata(out);
    EXPECT_FALSE(after.model.gps.has_value());
    EXPECT_FALSE(after.model.device.has_value());
    EXPECT_FALSE(after.model.timestamps.has_value());
    EXPECT_FALSE(after.model.camera_settings.has_value());
    EXPECT_FALSE(after.model.caption.has_value());
    EXPECT_EQ(after.model.orientation.value_or(0), 6U);
    EXPECT_EQ(after.model.pixel_width.value_or(0), 40U);
    EXPECT_EQ(after.model.pixel_height.value_or(0), 30U);
    EXPECT_FALSE(has_sensitive_data(classify_privacy(after.model)));
}


TEST(MetadataRewrite, PixelPayloadIsUnchanged)
{
    const Bytes jpeg = camera_jpeg();
    const StripResult r = strip_metadata(view(jpeg));
    ASSERT_FALSE(r.used_fallback);

    DecodedImage before;
    DecodedImage after;
    ASSERT_EQ(default_image_codec().decode(view(jpeg), &before), CodecStatus::Ok);
    ASSERT_EQ(default_image_codec().decode(view(r.bytes), &after),
              CodecStatus::Ok);
    EXPECT_EQ(pixel_payload_bytes(before), pixel_payload_bytes(after));
}


TEST(MetadataRewrite, StripIsIdempotent)
{
    const Bytes jpeg   = camera_jpeg();
    const StripResult once  = strip_metadata(view(jpeg));
    const StripResult twice = strip_metadata(view(once.bytes));

    EXPECT_FALSE(twice.used_fallback);
    EXPECT_EQ(twice.bytes, once.bytes);
    EXPECT_FALSE(has_sensitive_data(twice.analysis));
}


TEST(MetadataRewrite, PngStrip)
{
    const Bytes tiff = fixtures::sample_exif_tiff();
    const Bytes png  = fixtures::make_png(
        {
            fixtures::png_chunk("eXIf", view(tiff)),
            fixtures::png_text_chunk("Author", "Jane Roe"),
        },
        {}, 6, 4);

    const StripResult r = strip_metadata(view(png));
    ASSERT_EQ(r.rewrite.status, RewriteStatus::Ok);
    EXPECT_TRUE(fixtures::png_crcs_valid(view(r.bytes)));
    EXPECT_FALSE(fixtures::contains(view(r.bytes), "Jane Roe"));
    EXPECT_FALSE(fixtures::contains(view(r.bytes), "Canon"));
    EXPECT_EQ(count_exif_blocks(view(r.bytes)), 1U);

    const MetadataReadResult after = read_metadata(view(r.bytes));
    EXPECT_EQ(after.model.orientation.value_or(0), 6U);
    EXPECT_EQ(after.model.pixel_width.value_or(0), 6U);
    EXPECT_FALSE(after.model.gps.has_value());
}


TEST(MetadataRewrite, WebpStrip)
{
    const Bytes tiff = fixtures::sample_exif_tiff();
    const Bytes webp = fixtures::make_webp({
        fixtures::webp_vp8x_chunk(0x08, 320, 200),
        fixtures::webp_vp8_chunk(320, 200),
        fixtures::riff_chunk("EXIF", view(tiff)),
    });

    const StripResult r = strip_metadata(view(webp));
    ASSERT_EQ(r.rewrite.status, RewriteStatus::Ok);
    EXPECT_FALSE(fixtures::contains(view(r.bytes), "Canon"));
    EXPECT_EQ(fixtures::read_u32le_at(view(r.bytes), 4) + 8U, r.bytes.size());

    const MetadataReadResult after = read_metadata(view(r.bytes));
    EXPECT_EQ(after.report.exif, BlockStatus::Ok);
    EXPECT_EQ(after.model.orientation.value_or(0), 6U);
    EXPECT_EQ(after.model.pixel_width.value_or(0), 320U);
    EXPECT_FALSE(after.model.gps.has_value());
}


TEST(MetadataRewrite, UnsupportedInputsFallBackToOriginal)
{
    Bytes gif = fixtures::bytes_of("GIF89a");
    gif.resize(32, std::byte { 0 });
    const StripResult g = strip_metadata(view(gif));
    EXPECT_TRUE(g.used_fallback);
    EXPECT_EQ(g.rewrite.status, RewriteStatus::UnsupportedFormat);
    EXPECT_EQ(g.bytes, gif);

    const Bytes junk = fixtures::bytes_of("no image here");
    const StripResult u = strip_metadata(view(junk));
    EXPECT_TRUE(u.used_fallback);
    EXPECT_EQ(u.rewrite.status, RewriteStatus::UnrecognizedFormat);
    EXPECT_EQ(u.bytes, junk);
    EXPECT_FALSE(has_sensitive_data(u.analysis));
}


TEST(MetadataRewrite, EncodeFailureFallsBack)
{
    const Bytes jpeg = camera_jpeg();
    const FailingEncodeCodec codec {};

    StripOptions options;
    options.codec = &codec;
    const StripResult r = strip_metadata(view(jpeg), options);
    EXPECT_EQ(r.rewrite.status, RewriteStatus::EncodeFailure);
    EXPECT_TRUE(r.used_fallback);
    EXPECT_EQ(r.bytes, jpeg);
    // Classification still describes the input.
    EXPECT_TRUE(r.analysis.has_exact_location);

    std::vector<std::byte> out;
    const RewriteResult direct = rewrite_metadata(view(jpeg), MetadataModel {},
                                                  codec, &out);
    EXPECT_EQ(direct.status, RewriteStatus::EncodeFailure);
    EXPECT_TRUE(out.empty());
}


TEST(MetadataRewrite, SensitiveFieldsInSafeModelAreIgnored)
{
    const Bytes jpeg = fixtures::make_jpeg({});

    MetadataModel model;
    model.orientation = 3;
    GpsBlock gps;
    gps.latitude  = 10.0;
    gps.longitude = 20.0;
    gps.tag_count = 2;
    model.gps     = gps;
    DeviceBlock device;
    device.make      = "Leica";
    device.tag_count = 1;
    model.device     = device;

    std::vector<std::byte> out;
    const RewriteResult r = rewrite_metadata(view(jpeg), model, &out);
    ASSERT_EQ(r.status, RewriteStatus::Ok);
    EXPECT_EQ(r.removed_blocks, 0U);
    EXPECT_FALSE(fixtures::contains(view(out), "Leica"));

    const MetadataReadResult after = read_metadata(view(out));
    EXPECT_EQ(after.model.orientation.value_or(0), 3U);
    EXPECT_FALSE(after.model.gps.has_value());
    EXPECT_FALSE(after.model.device.has_value());
}


TEST(MetadataRewrite, NullOutput)
{
    const Bytes jpeg = fixtures::make_jpeg({});
    EXPECT_EQ(rewrite_metadata(view(jpeg), MetadataModel {}, nullptr).status,
              RewriteStatus::EncodeFailure);
}


TEST(MetadataRewrite, StatusNames)
{
    EXPECT_STREQ(rewrite_status_name(RewriteStatus::Ok), "ok");
    EXPECT_STREQ(rewrite_status_name(RewriteStatus::UnsupportedFormat),
                 "unsupported_format");
    EXPECT_STREQ(rewrite_status_name(RewriteStatus::EncodeFailure),
                 "encode_failure");
}

}  // namespace safemeta
