#include "safemeta/exif_tiff_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace safemeta;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    MetadataModel model;

    ExifDecodeOptions options;
    options.limits.max_entries_per_ifd = 512;
    options.limits.max_total_entries   = 4096;
    options.limits.max_string_bytes    = 64U * 1024U;

    (void)decode_exif_tiff(bytes, model, options);
    return 0;
}
