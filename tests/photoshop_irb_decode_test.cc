#include "safemeta/photoshop_irb_decode.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace safemeta {

using fixtures::Bytes;
using fixtures::irb_resource;
using fixtures::view;

TEST(PhotoshopIrbDecode, DecodesIptcAndLocatesEmbeddedPayloads)
{
    const Bytes iptc = fixtures::sample_iptc();
    const Bytes exif = fixtures::bytes_of("II*\0");
    const Bytes xmp  = fixtures::bytes_of("<x:xmpmeta/>");

    Bytes irb;
    fixtures::append_all(&irb, view(irb_resource(0x03ED, view(exif))));
    fixtures::append_all(&irb, view(irb_resource(0x0404, view(iptc))));
    const uint64_t exif_res = irb.size();
    fixtures::append_all(&irb, view(irb_resource(0x0422, view(exif))));
    const uint64_t xmp_res = irb.size();
    fixtures::append_all(&irb, view(irb_resource(0x0424, view(xmp))));

    CaptionBlock caption;
    const PhotoshopIrbDecodeResult r = decode_photoshop_irb(view(irb), caption);
    EXPECT_EQ(r.status, PhotoshopIrbDecodeStatus::Ok);
    EXPECT_EQ(r.resources_decoded, 4U);
    EXPECT_TRUE(r.iptc_found);
    EXPECT_EQ(r.iptc_status, IptcIimDecodeStatus::Ok);
    EXPECT_EQ(caption.dataset_count, 5U);
    EXPECT_EQ(caption.city.value_or(""), "Lisbon");

    // Resource header: "8BIM" + id + empty padded name + length.
    EXPECT_EQ(r.exif_offset, exif_res + 12U);
    EXPECT_EQ(r.exif_size, exif.size());
    EXPECT_EQ(r.xmp_offset, xmp_res + 12U);
    EXPECT_EQ(r.xmp_size, xmp.size());
}


TEST(PhotoshopIrbDecode, NoIptcResource)
{
    const Bytes data = fixtures::bytes_of("abc");
    const Bytes irb  = irb_resource(0x03ED, view(data));

    CaptionBlock caption;
    const PhotoshopIrbDecodeResult r = decode_photoshop_irb(view(irb), caption);
    EXPECT_EQ(r.status, PhotoshopIrbDecodeStatus::Ok);
    EXPECT_FALSE(r.iptc_found);
    EXPECT_EQ(r.iptc_status, IptcIimDecodeStatus::Unsupported);
    EXPECT_EQ(caption.dataset_count, 0U);
}


TEST(PhotoshopIrbDecode, TrailingZerosEndTheBlock)
{
    const Bytes iptc = fixtures::sample_iptc();
    Bytes irb        = irb_resource(0x0404, view(iptc));
    irb.insert(irb.end(), 6, std::byte { 0 });

    CaptionBlock caption;
    const PhotoshopIrbDecodeResult r = decode_photoshop_irb(view(irb), caption);
    EXPECT_EQ(r.status, PhotoshopIrbDecodeStatus::Ok);
    EXPECT_TRUE(r.iptc_found);
}


TEST(PhotoshopIrbDecode, RejectsForeignAndTruncatedData)
{
    CaptionBlock caption;
    const Bytes foreign = fixtures::bytes_of("Adobe_CM");
    EXPECT_EQ(decode_photoshop_irb(view(foreign), caption).status,
              PhotoshopIrbDecodeStatus::Unsupported);

    const Bytes iptc = fixtures::sample_iptc();
    Bytes irb        = irb_resource(0x0404, view(iptc));
    irb.resize(irb.size() - 8);
    EXPECT_EQ(decode_photoshop_irb(view(irb), caption).status,
              PhotoshopIrbDecodeStatus::Malformed);

    Bytes garbage = irb_resource(0x0404, view(iptc));
    fixtures::append_text(&garbage, "junk");
    EXPECT_EQ(decode_photoshop_irb(view(garbage), caption).status,
              PhotoshopIrbDecodeStatus::Malformed);
}


TEST(PhotoshopIrbDecode, ResourceLimit)
{
    const Bytes data = fixtures::bytes_of("ab");
    Bytes irb;
    for (int i = 0; i < 3; ++i) {
        fixtures::append_all(&irb, view(irb_resource(0x03ED, view(data))));
    }

    PhotoshopIrbDecodeOptions options;
    options.limits.max_resources = 2;

    CaptionBlock caption;
    EXPECT_EQ(decode_photoshop_irb(view(irb), caption, options).status,
              PhotoshopIrbDecodeStatus::LimitExceeded);
}

}  // namespace safemeta
