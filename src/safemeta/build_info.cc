#include "safemeta/build_info.h"

#include "safemeta/build_info_generated.h"

#include <zlib.h>
#undef zlib_version  // zlib.h macro clashes with BuildInfo::zlib_version

namespace safemeta {
namespace {

    static constexpr bool has_expat() noexcept
    {
#if defined(SAFEMETA_HAS_EXPAT) && SAFEMETA_HAS_EXPAT
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/SAFEMETA_BUILDINFO_VERSION,
        /*build_type=*/SAFEMETA_BUILDINFO_BUILD_TYPE,
        /*system_name=*/SAFEMETA_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/SAFEMETA_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/SAFEMETA_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/SAFEMETA_BUILDINFO_CXX_COMPILER_VERSION,
        /*option_with_expat=*/static_cast<bool>(SAFEMETA_BUILDINFO_WITH_EXPAT),
        /*has_expat=*/has_expat(),
        /*zlib_version=*/ZLIB_VERSION,
    };


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->append("SafeMeta v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [zlib-");
        append_sv(line1, bi.zlib_version);
        if (bi.has_expat) {
            line1->append(",expat");
        }
        line1->append("]");
    }

    if (line2) {
        line2->clear();
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace safemeta
