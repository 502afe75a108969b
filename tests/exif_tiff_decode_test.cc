#include "safemeta/exif_tiff_decode.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace safemeta {

using fixtures::Bytes;
using fixtures::make_tiff_le;
using fixtures::tiff_ascii;
using fixtures::tiff_long;
using fixtures::tiff_rationals;
using fixtures::tiff_short;
using fixtures::view;

TEST(ExifTiffDecode, DecodesDeviceTimestampsCameraAndGps)
{
    const Bytes tiff = fixtures::sample_exif_tiff();

    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    EXPECT_TRUE(r.exif_ifd_found);
    EXPECT_TRUE(r.gps_ifd_found);
    EXPECT_EQ(r.ifds_decoded, 3U);

    ASSERT_TRUE(model.device.has_value());
    EXPECT_EQ(model.device->make.value_or(""), "Canon");
    EXPECT_EQ(model.device->model.value_or(""), "Canon EOS R5");
    EXPECT_EQ(model.device->software.value_or(""), "Firmware 1.0.2");
    EXPECT_EQ(model.device->tag_count, 3U);

    ASSERT_TRUE(model.timestamps.has_value());
    EXPECT_EQ(model.timestamps->original.value_or(""), "2024:05:01 10:20:30");
    EXPECT_FALSE(model.timestamps->modified.has_value());

    ASSERT_TRUE(model.camera_settings.has_value());
    EXPECT_EQ(model.camera_settings->iso.value_or(0), 400U);
    EXPECT_EQ(model.camera_settings->lens_model.value_or(""),
              "RF24-105mm F4 L IS USM");

    ASSERT_TRUE(model.gps.has_value());
    EXPECT_EQ(model.gps->tag_count, 4U);
    ASSERT_TRUE(model.gps->latitude.has_value());
    ASSERT_TRUE(model.gps->longitude.has_value());
    EXPECT_NEAR(*model.gps->latitude, 37.775, 1e-9);
    EXPECT_NEAR(*model.gps->longitude, -(122.0 + 25.0 / 60.0), 1e-9);

    EXPECT_EQ(model.orientation.value_or(0), 6U);
    EXPECT_EQ(model.pixel_width.value_or(0), 4000U);
    EXPECT_EQ(model.pixel_height.value_or(0), 3000U);
}


TEST(ExifTiffDecode, MalformedGpsPointerKeepsDeviceInfo)
{
    const Bytes tiff = make_tiff_le({
        tiff_ascii(0x010F, "Apple"),
        tiff_ascii(0x0110, "iPhone 15"),
        tiff_long(0x8825, 0x00FFFFFFU),
    });

    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Malformed);
    EXPECT_EQ(r.ifd0_status, ExifDecodeStatus::Ok);
    EXPECT_TRUE(r.gps_ifd_found);
    EXPECT_EQ(r.gps_ifd_status, ExifDecodeStatus::Malformed);

    EXPECT_FALSE(model.gps.has_value());
    ASSERT_TRUE(model.device.has_value());
    EXPECT_EQ(model.device->make.value_or(""), "Apple");
    EXPECT_EQ(model.device->model.value_or(""), "iPhone 15");
}


TEST(ExifTiffDecode, EmptyGpsIfdIsFoundButEmpty)
{
    // A GPS IFD with only a version tag: the category exists, with no
    // coordinates.
    Bytes version;
    for (uint8_t b : { 2, 3, 0, 0 }) {
        version.push_back(std::byte { b });
    }
    fixtures::TiffEntry ver;
    ver.tag   = 0x0000;
    ver.type  = 1;
    ver.count = 4;
    ver.value = version;

    const Bytes tiff = make_tiff_le({ tiff_ascii(0x010F, "Sony") }, {},
                                    { ver });
    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    ASSERT_TRUE(model.gps.has_value());
    EXPECT_EQ(model.gps->tag_count, 1U);
    EXPECT_FALSE(model.gps->latitude.has_value());
    EXPECT_FALSE(model.gps->longitude.has_value());
}


TEST(ExifTiffDecode, SouthernHemisphereAndAltitude)
{
    const Bytes tiff = make_tiff_le(
        { tiff_short(0x0112, 1) }, {},
        {
            tiff_ascii(0x0001, "S"),
            tiff_rationals(0x0002, { { 33, 1 }, { 30, 1 }, { 0, 1 } }),
            tiff_ascii(0x0003, "E"),
            tiff_rationals(0x0004, { { 151, 1 }, { 12, 1 }, { 36, 1 } }),
            tiff_rationals(0x0006, { { 1205, 10 } }),
            tiff_rationals(0x0007, { { 14, 1 }, { 5, 1 }, { 9, 1 } }),
            tiff_ascii(0x001D, "2024:02:29"),
        });

    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    ASSERT_TRUE(model.gps.has_value());
    EXPECT_NEAR(model.gps->latitude.value_or(0.0), -33.5, 1e-9);
    EXPECT_NEAR(model.gps->longitude.value_or(0.0), 151.21, 1e-9);
    EXPECT_NEAR(model.gps->altitude.value_or(0.0), 120.5, 1e-9);
    EXPECT_EQ(model.gps->time_stamp.value_or(""), "14:05:09");
    EXPECT_EQ(model.gps->date_stamp.value_or(""), "2024:02:29");
    EXPECT_FALSE(model.device.has_value());
}


TEST(ExifTiffDecode, OutOfRangeGpsTimeStampIsSkipped)
{
    const Bytes tiff = make_tiff_le(
        { tiff_short(0x0112, 1) }, {},
        {
            tiff_ascii(0x0001, "N"),
            tiff_rationals(0x0002, { { 10, 1 }, { 0, 1 }, { 0, 1 } }),
            tiff_rationals(0x0007,
                           { { 0xFFFFFFFFU, 1 }, { 1, 1 }, { 1, 1 } }),
        });

    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    ASSERT_TRUE(model.gps.has_value());
    EXPECT_FALSE(model.gps->time_stamp.has_value());
    EXPECT_EQ(model.gps->tag_count, 3U);
    EXPECT_NEAR(model.gps->latitude.value_or(0.0), 10.0, 1e-9);

    const Bytes minutes = make_tiff_le(
        {}, {}, { tiff_rationals(0x0007, { { 12, 1 }, { 75, 1 }, { 0, 1 } }) });
    MetadataModel m2;
    (void)decode_exif_tiff(view(minutes), m2, ExifDecodeOptions {});
    ASSERT_TRUE(m2.gps.has_value());
    EXPECT_FALSE(m2.gps->time_stamp.has_value());
}


TEST(ExifTiffDecode, IgnoresOutOfRangeOrientation)
{
    const Bytes tiff = make_tiff_le({ tiff_short(0x0112, 9) });
    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    EXPECT_FALSE(model.orientation.has_value());
}


TEST(ExifTiffDecode, SerialNumberAndModifiedTimeAreRecorded)
{
    const Bytes tiff = make_tiff_le({ tiff_ascii(0x0132, "2024:01:01 00:00:00") },
                                    { tiff_ascii(0xA431, "SN12345  ") });
    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    ASSERT_TRUE(model.device.has_value());
    EXPECT_EQ(model.device->serial_number.value_or(""), "SN12345");
    EXPECT_FALSE(model.device->make.has_value());
    ASSERT_TRUE(model.timestamps.has_value());
    EXPECT_EQ(model.timestamps->modified.value_or(""), "2024:01:01 00:00:00");
    EXPECT_FALSE(model.timestamps->original.has_value());
}


TEST(ExifTiffDecode, RejectsUnknownByteOrderAndVersion)
{
    MetadataModel model;
    const Bytes bad = fixtures::bytes_of(std::string_view("XX*\0\x08\0\0\0", 8));
    EXPECT_EQ(decode_exif_tiff(view(bad), model, ExifDecodeOptions {}).status,
              ExifDecodeStatus::Unsupported);

    Bytes tiff = make_tiff_le({ tiff_ascii(0x010F, "Canon") });
    tiff[2]    = std::byte { 41 };
    EXPECT_EQ(decode_exif_tiff(view(tiff), model, ExifDecodeOptions {}).status,
              ExifDecodeStatus::Unsupported);

    const Bytes tiny = fixtures::bytes_of("II*");
    EXPECT_EQ(decode_exif_tiff(view(tiny), model, ExifDecodeOptions {}).status,
              ExifDecodeStatus::Malformed);
    EXPECT_TRUE(is_empty(model));
}


TEST(ExifTiffDecode, EntryLimitStopsDecoding)
{
    const Bytes tiff = make_tiff_le({
        tiff_ascii(0x010F, "Canon"),
        tiff_ascii(0x0110, "EOS"),
        tiff_short(0x0112, 3),
    });

    ExifDecodeOptions options;
    options.limits.max_entries_per_ifd = 2;

    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model, options);
    EXPECT_EQ(r.status, ExifDecodeStatus::LimitExceeded);
    EXPECT_EQ(r.ifd0_status, ExifDecodeStatus::LimitExceeded);
    EXPECT_FALSE(model.device.has_value());
}


TEST(ExifTiffDecode, SkipsValueOutsideStream)
{
    // ASCII value pointing past the end of the stream.
    fixtures::TiffEntry make;
    make.tag   = 0x010F;
    make.type  = 2;
    make.count = 32;
    fixtures::append_u32le(&make.value, 0x7FFF);

    const Bytes tiff = make_tiff_le({ make, tiff_short(0x0112, 8) });
    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Malformed);
    EXPECT_FALSE(model.device.has_value());
    EXPECT_EQ(model.orientation.value_or(0), 8U);
}


TEST(ExifTiffDecode, SubIfdPointingAtIfd0IsNotRevisited)
{
    const Bytes tiff = make_tiff_le({
        tiff_ascii(0x010F, "Canon"),
        tiff_long(0x8769, 8),
    });
    MetadataModel model;
    const ExifDecodeResult r = decode_exif_tiff(view(tiff), model,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    EXPECT_FALSE(r.exif_ifd_found);
    EXPECT_EQ(r.ifds_decoded, 1U);
    ASSERT_TRUE(model.device.has_value());
    EXPECT_EQ(model.device->tag_count, 1U);
}


TEST(ExifTiffDecode, StatusNames)
{
    EXPECT_STREQ(exif_decode_status_name(ExifDecodeStatus::Ok), "ok");
    EXPECT_STREQ(exif_decode_status_name(ExifDecodeStatus::Malformed),
                 "malformed");
    EXPECT_STREQ(exif_decode_status_name(ExifDecodeStatus::LimitExceeded),
                 "limit_exceeded");
}

}  // namespace safemeta
