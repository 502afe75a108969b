#include "safemeta/metadata_rewrite.h"

#include "safemeta/safe_metadata.h"

namespace safemeta {
namespace {

    static RewriteStatus to_rewrite_status(CodecStatus s) noexcept
    {
        switch (s) {
        case CodecStatus::Ok: return RewriteStatus::Ok;
        case CodecStatus::UnrecognizedFormat:
            return RewriteStatus::UnrecognizedFormat;
        case CodecStatus::UnsupportedFormat:
            return RewriteStatus::UnsupportedFormat;
        case CodecStatus::UndecodablePayload:
            return RewriteStatus::UndecodablePayload;
        case CodecStatus::EncodeFailure: return RewriteStatus::EncodeFailure;
        }
        return RewriteStatus::EncodeFailure;
    }

}  // namespace

RewriteResult
rewrite_metadata(std::span<const std::byte> file_bytes,
                 const MetadataModel& safe_model, const ImageCodec& codec,
                 std::vector<std::byte>* out) noexcept
{
    RewriteResult result;
    if (!out) {
        result.status = RewriteStatus::EncodeFailure;
        return result;
    }
    out->clear();

    DecodedImage image;
    const CodecStatus decoded = codec.decode(file_bytes, &image);
    result.format             = image.format;
    if (decoded != CodecStatus::Ok) {
        result.status = to_rewrite_status(decoded);
        return result;
    }
    result.removed_blocks = static_cast<uint32_t>(image.metadata_parts.size());

    std::vector<std::byte> exif;
    if (encode_safe_exif(safe_model, &exif) != SafeExifStatus::Ok) {
        result.status = RewriteStatus::EncodeFailure;
        return result;
    }
    result.exif_bytes = static_cast<uint32_t>(exif.size());

    const CodecStatus encoded = codec.encode(
        image, std::span<const std::byte>(exif.data(), exif.size()), out);
    result.status = to_rewrite_status(encoded);
    if (result.status != RewriteStatus::Ok) {
        out->clear();
    }
    return result;
}


RewriteResult
rewrite_metadata(std::span<const std::byte> file_bytes,
                 const MetadataModel& safe_model,
                 std::vector<std::byte>* out) noexcept
{
    return rewrite_metadata(file_bytes, safe_model, default_image_codec(),
                            out);
}


StripResult
strip_metadata(std::span<const std::byte> file_bytes,
               const StripOptions& options) noexcept
{
    StripResult result;

    const MetadataReadResult read = read_metadata(file_bytes, options.read);
    result.report                 = read.report;
    result.analysis               = classify_privacy(read.model);

    const ImageCodec& codec = options.codec ? *options.codec
                                            : default_image_codec();
    const MetadataModel safe = build_safe_metadata(read.model);
    result.rewrite = rewrite_metadata(file_bytes, safe, codec, &result.bytes);
    if (result.rewrite.status != RewriteStatus::Ok) {
        result.bytes.assign(file_bytes.begin(), file_bytes.end());
        result.used_fallback = true;
    }
    return result;
}


const char*
rewrite_status_name(RewriteStatus status) noexcept
{
    switch (status) {
    case RewriteStatus::Ok: return "ok";
    case RewriteStatus::UnrecognizedFormat: return "unrecognized_format";
    case RewriteStatus::UnsupportedFormat: return "unsupported_format";
    case RewriteStatus::UndecodablePayload: return "undecodable_payload";
    case RewriteStatus::EncodeFailure: return "encode_failure";
    }
    return "unknown";
}

}  // namespace safemeta
