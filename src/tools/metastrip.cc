#include "safemeta/batch_strip.h"
#include "safemeta/build_info.h"
#include "safemeta/file_io.h"
#include "safemeta/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace safemeta {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Removes privacy-sensitive metadata (GPS, device, timestamps, IPTC,\n"
            "XMP, comments) from JPEG, PNG and WebP images. Only orientation,\n"
            "pixel dimensions and color space are kept.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print SafeMeta build info\n"
            "  --no-build-info        Hide build info header\n"
            "  -o, --out <path>       Output file path (single input only)\n"
            "  --out-dir <dir>        Output directory (default: alongside input)\n"
            "  --force                Overwrite existing files\n"
            "  --strict               Fail instead of copying files that cannot be\n"
            "                         rewritten\n"
            "  --jobs N               Worker threads (default: 1, 0=all cores)\n"
            "  --max-file-bytes N     Optional file mapping cap in bytes (default: 0=unlimited)\n",
            argv0 ? argv0 : "metastrip");
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


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static std::string basename_only(const std::string& path)
    {
        const size_t sep = path.find_last_of("/\\");
        if (sep == std::string::npos) {
            return path;
        }
        return path.substr(sep + 1);
    }


    static std::string join_path(const std::string& dir,
                                 const std::string& name)
    {
        if (dir.empty()) {
            return name;
        }
        const char back = dir.back();
        if (back == '/' || back == '\\') {
            return dir + name;
        }
        return dir + "/" + name;
    }


    /// "photo.jpg" -> "photo.safe.jpg"; "photo" -> "photo.safe".
    static std::string with_safe_suffix(const std::string& path)
    {
        const size_t sep   = path.find_last_of("/\\");
        const size_t dot   = path.find_last_of('.');
        // A leading dot (".hidden") is part of the name, not an extension.
        const bool has_ext = dot != std::string::npos
                             && (sep == std::string::npos ? dot > 0
                                                          : dot > sep + 1);
        if (!has_ext) {
            return path + ".safe";
        }
        std::string out;
        out.reserve(path.size() + 5);
        out.append(path.data(), dot);
        out.append(".safe");
        out.append(path.data() + dot, path.size() - dot);
        return out;
    }


    static std::string build_output_path(const std::string& input_path,
                                         const std::string& out_dir)
    {
        if (out_dir.empty()) {
            return with_safe_suffix(input_path);
        }
        return join_path(out_dir, with_safe_suffix(basename_only(input_path)));
    }

}  // namespace
}  // namespace safemeta


int
main(int argc, char** argv)
{
    using namespace safemeta;

    bool show_build_info = true;
    bool force           = false;
    bool strict          = false;
    uint32_t jobs        = 1;
    std::string out_path;
    std::string out_dir;
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
        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--out") == 0)
            && i + 1 < argc) {
            out_path = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--out-dir") == 0 && i + 1 < argc) {
            out_dir = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            force = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--strict") == 0) {
            strict = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--jobs") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &jobs)) {
                std::fprintf(stderr, "invalid --jobs value\n");
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

    std::vector<std::string> input_paths;
    for (int i = first_path; i < argc; ++i) {
        if (argv[i] && argv[i][0] != '\0') {
            input_paths.emplace_back(argv[i]);
        }
    }
    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }
    if (!out_path.empty() && input_paths.size() != 1U) {
        std::fprintf(stderr,
                     "metastrip: --out requires exactly one input file\n");
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    bool any_failed = false;

    // Map every input first; the batch runs over the mapped views.
    std::vector<MappedFile> files(input_paths.size());
    std::vector<size_t> batch_to_input;
    std::vector<std::span<const std::byte>> images;
    for (size_t i = 0; i < input_paths.size(); ++i) {
        const FileIoStatus st = files[i].open(input_paths[i].c_str(),
                                              policy.max_file_bytes);
        if (st != FileIoStatus::Ok) {
            std::fprintf(stderr, "metastrip: %s: %s\n", input_paths[i].c_str(),
                         file_io_status_name(st));
            any_failed = true;
            continue;
        }
        batch_to_input.push_back(i);
        images.push_back(files[i].bytes());
    }

    BatchOptions options;
    options.max_workers = jobs;
    apply_resource_policy(policy, &options.strip.read);
    const BatchResult batch = strip_batch(
        std::span<const std::span<const std::byte>>(images.data(),
                                                    images.size()),
        options);

    for (size_t bi = 0; bi < batch.items.size(); ++bi) {
        const BatchItem& item   = batch.items[bi];
        const std::string& path = input_paths[batch_to_input[bi]];
        const PrivacyRiskLevel level = privacy_risk_level(item.analysis);

        std::printf("== %s\n", path.c_str());
        std::printf("  risk=%s rewrite=%s\n", privacy_risk_level_name(level),
                    rewrite_status_name(item.status));
        std::printf("  %s\n", removed_data_description(item.analysis).c_str());

        if (item.used_fallback) {
            if (strict) {
                std::fprintf(stderr, "metastrip: %s: %s (not written)\n",
                             path.c_str(), rewrite_status_name(item.status));
                any_failed = true;
                continue;
            }
            std::fprintf(stderr,
                         "metastrip: %s: %s (original bytes copied)\n",
                         path.c_str(), rewrite_status_name(item.status));
        }

        const std::string out_file = out_path.empty()
                                         ? build_output_path(path, out_dir)
                                         : out_path;
        const FileIoStatus ws = write_file_bytes(
            out_file.c_str(),
            std::span<const std::byte>(item.bytes.data(), item.bytes.size()),
            force);
        if (ws == FileIoStatus::AlreadyExists) {
            std::fprintf(stderr, "metastrip: exists: %s (use --force)\n",
                         out_file.c_str());
            any_failed = true;
            continue;
        }
        if (ws != FileIoStatus::Ok) {
            std::fprintf(stderr, "metastrip: %s: %s\n", out_file.c_str(),
                         file_io_status_name(ws));
            any_failed = true;
            continue;
        }
        std::printf("  -> %s (%llu bytes)\n", out_file.c_str(),
                    static_cast<unsigned long long>(item.bytes.size()));
    }

    return any_failed ? 1 : 0;
}
