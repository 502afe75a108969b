#include "safemeta/batch_strip.h"
#include "safemeta/build_info.h"
#include "safemeta/console_format.h"
#include "safemeta/metadata_read.h"
#include "safemeta/metadata_rewrite.h"
#include "safemeta/privacy_classify.h"
#include "safemeta/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace safemeta {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> py_bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.c_str()), data.size());
    }


    static nb::bytes vector_to_py(const std::vector<std::byte>& bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static MetadataReadOptions read_options(uint64_t max_inflate_bytes)
    {
        SafeMetaResourcePolicy policy;
        policy.payload_limits.max_output_bytes = max_inflate_bytes;
        MetadataReadOptions options;
        apply_resource_policy(policy, &options);
        return options;
    }


    static nb::dict analysis_to_python(const PrivacyAnalysis& a)
    {
        const PrivacyRiskLevel level = privacy_risk_level(a);
        nb::dict d;
        d["has_gps_data"]        = nb::bool_(a.has_gps_data);
        d["has_exact_location"]  = nb::bool_(a.has_exact_location);
        d["has_device_info"]     = nb::bool_(a.has_device_info);
        d["has_timestamps"]      = nb::bool_(a.has_timestamps);
        d["has_camera_settings"] = nb::bool_(a.has_camera_settings);
        d["has_iptc_data"]       = nb::bool_(a.has_iptc_data);
        d["has_sensitive_data"]  = nb::bool_(has_sensitive_data(a));
        d["risk_level"]          = nb::str(privacy_risk_level_name(level));
        d["risk_description"]    = nb::str(risk_level_description(level));
        d["removed"]             = nb::str(removed_data_description(a).c_str());
        return d;
    }


    static nb::dict report_to_python(const MetadataReadReport& r)
    {
        nb::dict d;
        d["format"]       = nb::str(container_format_name(r.format));
        d["scan"]         = nb::str(scan_status_name(r.scan.status));
        d["exif"]         = nb::str(block_status_name(r.exif));
        d["gps"]          = nb::str(block_status_name(r.gps));
        d["iptc"]         = nb::str(block_status_name(r.iptc));
        d["xmp"]          = nb::str(block_status_name(r.xmp));
        d["blocks_found"] = nb::int_(r.blocks_found);
        return d;
    }


    static nb::dict analyze(const nb::bytes& data, bool fields,
                            uint64_t max_inflate_bytes)
    {
        const MetadataReadOptions options = read_options(max_inflate_bytes);
        MetadataReadResult read;
        {
            nb::gil_scoped_release gil_release;
            read = read_metadata(py_bytes_view(data), options);
        }

        nb::dict d        = analysis_to_python(classify_privacy(read.model));
        d["report"]       = report_to_python(read.report);
        if (fields) {
            std::string text;
            append_sensitive_fields(read.model, 4096U, &text);
            d["fields"] = nb::str(text.c_str());
        }
        return d;
    }


    static std::pair<nb::bytes, nb::dict> strip(const nb::bytes& data,
                                                bool strict,
                                                uint64_t max_inflate_bytes)
    {
        StripOptions options;
        options.read = read_options(max_inflate_bytes);
        StripResult res;
        {
            nb::gil_scoped_release gil_release;
            res = strip_metadata(py_bytes_view(data), options);
        }

        if (strict && res.used_fallback) {
            std::string msg = "strip failed: ";
            msg.append(rewrite_status_name(res.rewrite.status));
            throw std::runtime_error(msg);
        }

        nb::dict d         = analysis_to_python(res.analysis);
        d["report"]        = report_to_python(res.report);
        d["status"]        = nb::str(rewrite_status_name(res.rewrite.status));
        d["used_fallback"] = nb::bool_(res.used_fallback);
        d["removed_blocks"] = nb::int_(res.rewrite.removed_blocks);
        return { vector_to_py(res.bytes), d };
    }


    static std::vector<std::pair<nb::bytes, nb::dict>>
    strip_many(const std::vector<nb::bytes>& images, uint32_t max_workers)
    {
        std::vector<std::span<const std::byte>> views;
        views.reserve(images.size());
        for (const nb::bytes& b : images) {
            views.push_back(py_bytes_view(b));
        }

        BatchOptions options;
        options.max_workers = max_workers;
        BatchResult batch;
        {
            nb::gil_scoped_release gil_release;
            batch = strip_batch(std::span<const std::span<const std::byte>>(
                                    views.data(), views.size()),
                                options);
        }

        std::vector<std::pair<nb::bytes, nb::dict>> out;
        out.reserve(batch.items.size());
        for (const BatchItem& item : batch.items) {
            nb::dict d         = analysis_to_python(item.analysis);
            d["status"]        = nb::str(rewrite_status_name(item.status));
            d["used_fallback"] = nb::bool_(item.used_fallback);
            out.emplace_back(vector_to_py(item.bytes), d);
        }
        return out;
    }

}  // namespace
}  // namespace safemeta


NB_MODULE(_safemeta, m)
{
    using namespace safemeta;

    m.doc()               = "SafeMeta image metadata privacy bindings (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<PrivacyRiskLevel>(m, "PrivacyRiskLevel")
        .value("None_", PrivacyRiskLevel::None)
        .value("Low", PrivacyRiskLevel::Low)
        .value("Medium", PrivacyRiskLevel::Medium)
        .value("High", PrivacyRiskLevel::High);

    m.def("analyze", &analyze, "data"_a, "fields"_a = false,
          "max_inflate_bytes"_a = 16ULL * 1024ULL * 1024ULL,
          "Classifies the metadata of an in-memory image.");
    m.def("strip", &strip, "data"_a, "strict"_a = false,
          "max_inflate_bytes"_a = 16ULL * 1024ULL * 1024ULL,
          "Returns (bytes, report). With strict=True a failed rewrite raises "
          "instead of returning the original bytes.");
    m.def("strip_batch", &strip_many, "images"_a, "max_workers"_a = 1U);

    m.def("info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["option_with_expat"]    = nb::bool_(bi.option_with_expat);
        d["has_expat"]            = nb::bool_(bi.has_expat);
        d["zlib_version"]         = sv_to_py(bi.zlib_version);
        return d;
    });
    m.def("info_lines", &info_lines);
}
