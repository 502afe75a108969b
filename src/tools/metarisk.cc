#include "safemeta/build_info.h"
#include "safemeta/console_format.h"
#include "safemeta/file_io.h"
#include "safemeta/metadata_read.h"
#include "safemeta/privacy_classify.h"
#include "safemeta/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace safemeta {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Reports which privacy-sensitive metadata an image carries.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print SafeMeta build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --fields               Print the decoded sensitive values\n"
            "  --max-value-bytes N    Cut printed values at N bytes (default: 256)\n"
            "  --max-file-bytes N     Optional file mapping cap in bytes (default: 0=unlimited)\n",
            argv0 ? argv0 : "metarisk");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void print_report(const char* path, const MetadataReadResult& read,
                             bool show_fields, uint32_t max_value_bytes)
    {
        const PrivacyAnalysis analysis = classify_privacy(read.model);
        const PrivacyRiskLevel level   = privacy_risk_level(analysis);
        const MetadataReadReport& rep  = read.report;

        std::printf("== %s\n", path);
        std::printf("  format=%s blocks=%u scan=%s\n",
                    container_format_name(rep.format), rep.blocks_found,
                    scan_status_name(rep.scan.status));
        std::printf("  exif=%s gps=%s iptc=%s xmp=%s\n",
                    block_status_name(rep.exif), block_status_name(rep.gps),
                    block_status_name(rep.iptc), block_status_name(rep.xmp));

        std::string flags;
        append_privacy_flags(analysis, &flags);
        std::printf("  %s\n", flags.c_str());
        std::printf("  risk=%s (%s)\n", privacy_risk_level_name(level),
                    risk_level_description(level));
        std::printf("  sensitive=%u\n", has_sensitive_data(analysis) ? 1U : 0U);
        std::printf("  %s\n", removed_data_description(analysis).c_str());

        if (read.model.pixel_width && read.model.pixel_height) {
            std::printf("  pixels=%ux%u color=%s orientation=%u\n",
                        *read.model.pixel_width, *read.model.pixel_height,
                        color_model_name(read.model.color_model),
                        static_cast<unsigned>(
                            read.model.orientation.value_or(1)));
        }

        if (show_fields) {
            std::string fields;
            append_sensitive_fields(read.model, max_value_bytes, &fields);
            std::fputs(fields.c_str(), stdout);
        }
    }

}  // namespace
}  // namespace safemeta


int
main(int argc, char** argv)
{
    using namespace safemeta;

    bool show_build_info     = true;
    bool show_fields         = false;
    uint64_t max_value_bytes = 256;
    SafeMetaResourcePolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--fields") == 0) {
            show_fields = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-value-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_value_bytes)
                || max_value_bytes > 0xFFFFFFFFULL) {
                std::fprintf(stderr, "invalid --max-value-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (first_path >= argc) {
        usage(argv[0]);
        return 2;
    }
    if (show_build_info) {
        print_build_info_header();
    }

    MetadataReadOptions options;
    apply_resource_policy(policy, &options);

    bool any_failed = false;
    for (int i = first_path; i < argc; ++i) {
        const char* path = argv[i];
        if (!path || !*path) {
            continue;
        }

        MappedFile mapped;
        const FileIoStatus st = mapped.open(path, policy.max_file_bytes);
        if (st != FileIoStatus::Ok) {
            std::fprintf(stderr, "metarisk: %s: %s\n", path,
                         file_io_status_name(st));
            any_failed = true;
            continue;
        }

        const MetadataReadResult read = read_metadata(mapped.bytes(), options);
        if (read.report.format == ContainerFormat::Unknown) {
            std::fprintf(stderr, "metarisk: %s: unrecognized_format\n", path);
        }
        print_report(path, read, show_fields,
                     static_cast<uint32_t>(max_value_bytes));
    }

    return any_failed ? 1 : 0;
}
