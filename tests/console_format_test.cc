#include "safemeta/console_format.h"

#include "safemeta/build_info.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace safemeta {

TEST(ConsoleFormat, PrintableAsciiIsCopied)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_ascii("Canon EOS R5", 0, &out));
    EXPECT_EQ(out, "Canon EOS R5");

    out.clear();
    EXPECT_FALSE(append_console_escaped_ascii("a\"b\\", 0, &out));
    EXPECT_EQ(out, "a\\\"b\\\\");
}


TEST(ConsoleFormat, ControlAndNonAsciiAreEscaped)
{
    std::string out = "> ";
    const std::string_view s("x\ny\x01\xC3\x1B[2J", 9);
    EXPECT_TRUE(append_console_escaped_ascii(s, 0, &out));
    EXPECT_EQ(out, "> x\\ny\\x01\\xC3\\x1B[2J");
}


TEST(ConsoleFormat, Truncation)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
    EXPECT_EQ(out, "abc...");

    out.clear();
    EXPECT_FALSE(append_console_escaped_ascii("abc", 3, &out));
    EXPECT_EQ(out, "abc");
}


TEST(ConsoleFormat, PrivacyFlags)
{
    PrivacyAnalysis a;
    a.has_gps_data       = true;
    a.has_exact_location = true;

    std::string out;
    append_privacy_flags(a, &out);
    EXPECT_EQ(out, "gps=1 exact_location=1 device=0 timestamps=0 camera=0 iptc=0");
}


TEST(ConsoleFormat, SensitiveFields)
{
    MetadataModel m;
    GpsBlock gps;
    gps.latitude  = 37.5;
    gps.tag_count = 1;
    m.gps         = gps;
    DeviceBlock device;
    device.make      = "Canon";
    device.model     = "Canon EOS R5";
    device.tag_count = 2;
    m.device         = device;
    CameraSettingsBlock camera;
    camera.iso        = 400;
    camera.tag_count  = 1;
    m.camera_settings = camera;
    CaptionBlock caption;
    caption.keywords      = { "a\tb" };
    caption.dataset_count = 1;
    m.caption             = caption;

    std::string out;
    append_sensitive_fields(m, 0, &out);
    EXPECT_EQ(out, "  gps.latitude=37.500000\n"
                   "  device.make=\"Canon\"\n"
                   "  device.model=\"Canon EOS R5\"\n"
                   "  camera.iso=400\n"
                   "  caption.keyword=\"a\\tb\"\n");

    out.clear();
    MetadataModel only_device;
    only_device.device = device;
    append_sensitive_fields(only_device, 5, &out);
    EXPECT_EQ(out, "  device.make=\"Canon\"\n"
                   "  device.model=\"Canon...\"\n");

    out.clear();
    append_sensitive_fields(MetadataModel {}, 0, &out);
    EXPECT_TRUE(out.empty());
}


TEST(ConsoleFormat, BuildInfoLines)
{
    std::string line1;
    std::string line2;
    format_build_info_lines(&line1, &line2);
    EXPECT_EQ(line1.rfind("SafeMeta v", 0), 0U);
    EXPECT_NE(line1.find("[zlib-"), std::string::npos);
    EXPECT_EQ(line2.rfind("built with ", 0), 0U);

    const BuildInfo& bi = build_info();
    EXPECT_FALSE(bi.version.empty());
    EXPECT_FALSE(bi.zlib_version.empty());
#if defined(SAFEMETA_HAS_EXPAT) && SAFEMETA_HAS_EXPAT
    EXPECT_TRUE(bi.has_expat);
    EXPECT_NE(line1.find(",expat"), std::string::npos);
#else
    EXPECT_FALSE(bi.has_expat);
#endif
}

}  // namespace safemeta
