#pragma once

#include "safemeta/metadata_model.h"
#include "safemeta/privacy_classify.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace safemeta {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when `s` held control or non-ASCII bytes, or was truncated.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends the six analysis flags as `key=0|1` pairs separated by spaces:
// `gps=1 exact_location=1 device=0 timestamps=0 camera=0 iptc=0`.
void
append_privacy_flags(const PrivacyAnalysis& analysis,
                     std::string* out) noexcept;

// Appends one `  <category>.<field>=<value>` line per sensitive value held in
// `model` (GPS, device, timestamps, camera settings, caption). Strings are
// escaped with `append_console_escaped_ascii` and cut at `max_value_bytes`.
void
append_sensitive_fields(const MetadataModel& model, uint32_t max_value_bytes,
                        std::string* out) noexcept;

}  // namespace safemeta
