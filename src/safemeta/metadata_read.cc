#include "safemeta/metadata_read.h"

#include "byte_io_internal.h"

#include <array>
#include <utility>
#include <vector>

namespace safemeta {
namespace {

    using byte_io::match;

    // Real files carry a handful of blocks; the rest are ignored.
    constexpr size_t kMaxBlocks = 256;


    static BlockStatus to_block_status(ExifDecodeStatus s) noexcept
    {
        switch (s) {
        case ExifDecodeStatus::Ok: return BlockStatus::Ok;
        case ExifDecodeStatus::Unsupported: return BlockStatus::Unsupported;
        case ExifDecodeStatus::Malformed: return BlockStatus::Malformed;
        case ExifDecodeStatus::LimitExceeded: return BlockStatus::LimitExceeded;
        }
        return BlockStatus::Malformed;
    }


    static BlockStatus to_block_status(IptcIimDecodeStatus s) noexcept
    {
        switch (s) {
        case IptcIimDecodeStatus::Ok: return BlockStatus::Ok;
        case IptcIimDecodeStatus::Unsupported: return BlockStatus::Unsupported;
        case IptcIimDecodeStatus::Malformed: return BlockStatus::Malformed;
        case IptcIimDecodeStatus::LimitExceeded:
            return BlockStatus::LimitExceeded;
        }
        return BlockStatus::Malformed;
    }


    static BlockStatus to_block_status(PhotoshopIrbDecodeStatus s) noexcept
    {
        switch (s) {
        case PhotoshopIrbDecodeStatus::Ok: return BlockStatus::Ok;
        case PhotoshopIrbDecodeStatus::Unsupported:
            return BlockStatus::Unsupported;
        case PhotoshopIrbDecodeStatus::Malformed: return BlockStatus::Malformed;
        case PhotoshopIrbDecodeStatus::LimitExceeded:
            return BlockStatus::LimitExceeded;
        }
        return BlockStatus::Malformed;
    }


    static BlockStatus to_block_status(XmpDecodeStatus s) noexcept
    {
        switch (s) {
        case XmpDecodeStatus::Ok: return BlockStatus::Ok;
        case XmpDecodeStatus::Unsupported: return BlockStatus::Unsupported;
        case XmpDecodeStatus::Malformed: return BlockStatus::Malformed;
        case XmpDecodeStatus::LimitExceeded: return BlockStatus::LimitExceeded;
        }
        return BlockStatus::Malformed;
    }


    static BlockStatus to_block_status(PayloadStatus s) noexcept
    {
        switch (s) {
        case PayloadStatus::Ok: return BlockStatus::Ok;
        case PayloadStatus::Unsupported: return BlockStatus::Unsupported;
        case PayloadStatus::Malformed: return BlockStatus::Malformed;
        case PayloadStatus::LimitExceeded: return BlockStatus::LimitExceeded;
        }
        return BlockStatus::Malformed;
    }


    static std::span<const std::byte>
    sub_range(std::span<const std::byte> bytes, uint64_t off,
              uint64_t size) noexcept
    {
        if (off > bytes.size() || size > bytes.size() - off) {
            return {};
        }
        return bytes.subspan(static_cast<size_t>(off),
                             static_cast<size_t>(size));
    }


    /// Materializes a block, decoding raw-profile hex text when needed.
    static PayloadStatus load_block(std::span<const std::byte> file_bytes,
                                    const ContainerBlockRef& block,
                                    const PayloadOptions& options,
                                    std::vector<std::byte>* out) noexcept
    {
        const PayloadResult raw = extract_payload(file_bytes, block, out,
                                                  options);
        if (raw.status != PayloadStatus::Ok) {
            return raw.status;
        }
        if (block.kind != ContainerBlockKind::RawProfileExif
            && block.kind != ContainerBlockKind::RawProfileIptc) {
            return PayloadStatus::Ok;
        }
        std::vector<std::byte> decoded;
        const PayloadResult hex = decode_raw_profile_text(
            std::span<const std::byte>(out->data(), out->size()), &decoded,
            options);
        if (hex.status != PayloadStatus::Ok) {
            out->clear();
            return hex.status;
        }
        *out = std::move(decoded);
        return PayloadStatus::Ok;
    }


    /// Skips the "Exif\0\0" preamble some writers keep in raw profiles.
    static std::span<const std::byte>
    strip_exif_preamble(std::span<const std::byte> bytes) noexcept
    {
        if (match(bytes, 0, "Exif\0\0", 6)) {
            return bytes.subspan(6);
        }
        return bytes;
    }


    struct ReadState final {
        bool exif_done    = false;
        bool caption_done = false;
        bool xmp_done     = false;
    };


    static void decode_exif_bytes(std::span<const std::byte> tiff,
                                  const MetadataReadOptions& options,
                                  MetadataReadResult* out,
                                  ExifDecodeResult* exif) noexcept
    {
        *exif = decode_exif_tiff(tiff, out->model, options.exif);
        out->report.exif = to_block_status(exif->status);
        if (exif->gps_ifd_found) {
            out->report.gps = to_block_status(exif->gps_ifd_status);
        }
    }


    static void decode_iptc_bytes(std::span<const std::byte> iptc,
                                  const MetadataReadOptions& options,
                                  MetadataReadResult* out,
                                  ReadState* state) noexcept
    {
        CaptionBlock caption;
        const IptcIimDecodeResult r = decode_iptc_iim(iptc, caption,
                                                      options.iptc);
        out->report.iptc = to_block_status(r.status);
        if (r.status == IptcIimDecodeStatus::Ok) {
            out->model.caption = std::move(caption);
            state->caption_done = true;
        }
    }


    static void decode_irb_bytes(std::span<const std::byte> irb,
                                 const MetadataReadOptions& options,
                                 MetadataReadResult* out, ReadState* state,
                                 std::span<const std::byte>* xmp_out) noexcept
    {
        CaptionBlock caption;
        const PhotoshopIrbDecodeResult r
            = decode_photoshop_irb(irb, caption, options.photoshop_irb);
        if (r.iptc_found) {
            out->report.iptc = to_block_status(r.iptc_status);
            if (r.iptc_status == IptcIimDecodeStatus::Ok) {
                out->model.caption = std::move(caption);
                state->caption_done = true;
            }
        } else if (r.status != PhotoshopIrbDecodeStatus::Ok) {
            out->report.iptc = to_block_status(r.status);
        }

        if (!state->exif_done && r.exif_size != 0U) {
            const std::span<const std::byte> tiff
                = sub_range(irb, r.exif_offset, r.exif_size);
            if (!tiff.empty()) {
                ExifDecodeResult exif;
                decode_exif_bytes(tiff, options, out, &exif);
                state->exif_done = true;
            }
        }
        if (xmp_out && xmp_out->empty() && r.xmp_size != 0U) {
            *xmp_out = sub_range(irb, r.xmp_offset, r.xmp_size);
        }
    }


    static void decode_xmp_bytes(std::span<const std::byte> xmp,
                                 const MetadataReadOptions& options,
                                 MetadataReadResult* out,
                                 ReadState* state) noexcept
    {
        if (!options.decode_xmp) {
            out->report.xmp = BlockStatus::Unsupported;
            state->xmp_done = true;
            return;
        }
        const XmpDecodeResult r = decode_xmp_packet(xmp, out->model,
                                                    options.xmp);
        out->report.xmp = to_block_status(r.status);
        state->xmp_done = true;
    }


    static void apply_pixel_header(std::span<const std::byte> file_bytes,
                                   MetadataReadResult* out) noexcept
    {
        PixelHeader header;
        if (!read_pixel_header(file_bytes, out->report.format, &header)) {
            return;
        }
        out->report.pixel_header_found = true;
        if (header.width != 0U && header.height != 0U) {
            out->model.pixel_width  = header.width;
            out->model.pixel_height = header.height;
        }
        if (header.color_model != ColorModel::Unknown) {
            out->model.color_model = header.color_model;
        }
    }

}  // namespace

MetadataReadResult
read_metadata(std::span<const std::byte> file_bytes,
              const MetadataReadOptions& options) noexcept
{
    MetadataReadResult out;
    out.report.format = detect_format(file_bytes);
    if (out.report.format == ContainerFormat::Unknown) {
        out.report.scan.status = ScanStatus::Unsupported;
        return out;
    }

    std::array<ContainerBlockRef, kMaxBlocks> blocks {};
    out.report.scan = scan_auto(file_bytes, blocks);
    out.report.blocks_found = out.report.scan.needed;
    const size_t count = out.report.scan.written < blocks.size()
                             ? out.report.scan.written
                             : blocks.size();
    const std::span<const ContainerBlockRef> found(blocks.data(), count);

    ReadState state;
    std::vector<std::byte> scratch;
    ExifDecodeResult exif;
    std::span<const std::byte> exif_tiff;

    // 1) EXIF: the first block wins over later duplicates.
    std::vector<std::byte> exif_payload;
    for (const ContainerBlockRef& b : found) {
        if (b.kind != ContainerBlockKind::Exif
            && b.kind != ContainerBlockKind::RawProfileExif) {
            continue;
        }
        const PayloadStatus ps = load_block(file_bytes, b, options.payload,
                                            &exif_payload);
        if (ps != PayloadStatus::Ok) {
            out.report.exif = to_block_status(ps);
            break;
        }
        exif_tiff = strip_exif_preamble(
            std::span<const std::byte>(exif_payload.data(),
                                       exif_payload.size()));
        decode_exif_bytes(exif_tiff, options, &out, &exif);
        state.exif_done = true;
        break;
    }

    // 2) IPTC from Photoshop IRB or PNG raw profiles. XMP found in a
    // Photoshop resource is kept as a fallback packet.
    std::span<const std::byte> irb_xmp;
    for (const ContainerBlockRef& b : found) {
        if (state.caption_done) {
            break;
        }
        if (b.kind == ContainerBlockKind::PhotoshopIrb) {
            const std::span<const std::byte> irb
                = sub_range(file_bytes, b.data_offset, b.data_size);
            decode_irb_bytes(irb, options, &out, &state, &irb_xmp);
        } else if (b.kind == ContainerBlockKind::RawProfileIptc) {
            const PayloadStatus ps = load_block(file_bytes, b, options.payload,
                                                &scratch);
            if (ps != PayloadStatus::Ok) {
                out.report.iptc = to_block_status(ps);
                continue;
            }
            const std::span<const std::byte> profile(scratch.data(),
                                                     scratch.size());
            if (match(profile, 0, "8BIM", 4)) {
                decode_irb_bytes(profile, options, &out, &state, nullptr);
            } else {
                decode_iptc_bytes(profile, options, &out, &state);
            }
        }
    }

    // TIFF files (and some EXIF writers) embed IPTC and XMP as IFD0 tags.
    std::span<const std::byte> tiff_xmp;
    if (state.exif_done) {
        if (!state.caption_done && exif.iptc_size != 0U) {
            const std::span<const std::byte> iptc
                = sub_range(exif_tiff, exif.iptc_offset, exif.iptc_size);
            if (!iptc.empty()) {
                decode_iptc_bytes(iptc, options, &out, &state);
            }
        }
        if (exif.xmp_size != 0U) {
            tiff_xmp = sub_range(exif_tiff, exif.xmp_offset, exif.xmp_size);
        }
    }

    // 3) XMP fills whatever EXIF and IPTC did not.
    std::vector<std::byte> xmp_payload;
    for (const ContainerBlockRef& b : found) {
        if (b.kind != ContainerBlockKind::Xmp) {
            continue;
        }
        const PayloadStatus ps = load_block(file_bytes, b, options.payload,
                                            &xmp_payload);
        if (ps != PayloadStatus::Ok) {
            out.report.xmp = to_block_status(ps);
            state.xmp_done = true;
            break;
        }
        decode_xmp_bytes(std::span<const std::byte>(xmp_payload.data(),
                                                    xmp_payload.size()),
                         options, &out, &state);
        break;
    }
    if (!state.xmp_done && !tiff_xmp.empty()) {
        decode_xmp_bytes(tiff_xmp, options, &out, &state);
    }
    if (!state.xmp_done && !irb_xmp.empty()) {
        decode_xmp_bytes(irb_xmp, options, &out, &state);
    }

    // 4) The pixel header is authoritative for dimensions and color model.
    apply_pixel_header(file_bytes, &out);
    return out;
}


const char*
block_status_name(BlockStatus status) noexcept
{
    switch (status) {
    case BlockStatus::Absent: return "absent";
    case BlockStatus::Ok: return "ok";
    case BlockStatus::Malformed: return "malformed";
    case BlockStatus::LimitExceeded: return "limit_exceeded";
    case BlockStatus::Unsupported: return "unsupported";
    }
    return "unknown";
}

}  // namespace safemeta
