#include "diagnostic/diagnostic_normalizer.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace codeauditor {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

DiagnosticNormalizer::DiagnosticNormalizer(size_t max_length)
    : max_length_(max_length) {}

std::optional<std::string> DiagnosticNormalizer::diagnose(const SandboxOutcome& outcome) const {
    switch (outcome.status) {
        case SandboxStatus::COMPILED:
            return std::nullopt;

        case SandboxStatus::TIMED_OUT:
            return std::string(kTimedOut);

        case SandboxStatus::COMPILE_FAILED: {
            auto text = normalize(outcome.output, outcome.workdir);
            if (!text.empty()) return text;
            if (outcome.signal) {
                return std::format("compiler terminated by signal {}", *outcome.signal);
            }
            return std::format("compiler exited with status {}", outcome.exit_code.value_or(-1));
        }

        case SandboxStatus::INFRASTRUCTURE_ERROR:
            break;
    }
    throw std::invalid_argument("infrastructure errors have no code diagnostic");
}

std::string DiagnosticNormalizer::normalize(std::string_view raw, std::string_view workdir) const {
    std::string text = strip_escape_sequences(raw);
    text = normalize_line_endings(text);
    text = drop_control_bytes(text);
    if (!workdir.empty()) {
        // "<workdir>/snippet.rs" -> "snippet.rs", any other mention -> placeholder
        text = redact(text, std::string(workdir) + "/", "");
        text = redact(text, workdir, kRedactedWorkdir);
    }
    return truncate_utf8(utils::trim(text), max_length_);
}

// ============================================================================
// Passes
// ============================================================================

std::string DiagnosticNormalizer::strip_escape_sequences(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        if (in[i] != kEsc) {
            out += in[i++];
            continue;
        }
        ++i;
        if (i >= in.size()) break;

        if (in[i] == '[') {
            // CSI: parameters 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E
            ++i;
            while (i < in.size() && in[i] >= 0x30 && in[i] <= 0x3F) ++i;
            while (i < in.size() && in[i] >= 0x20 && in[i] <= 0x2F) ++i;
            if (i < in.size() && in[i] >= 0x40 && in[i] <= 0x7E) ++i;
        } else if (in[i] == ']') {
            // OSC: terminated by BEL or ST (ESC \)
            ++i;
            while (i < in.size()) {
                if (in[i] == kBel) { ++i; break; }
                if (in[i] == kEsc && i + 1 < in.size() && in[i + 1] == '\\') { i += 2; break; }
                ++i;
            }
        } else {
            ++i;    // Two-byte sequence
        }
    }
    return out;
}

std::string DiagnosticNormalizer::normalize_line_endings(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\r') {
            out += '\n';
            if (i + 1 < in.size() && in[i + 1] == '\n') ++i;
        } else {
            out += in[i];
        }
    }
    return out;
}

std::string DiagnosticNormalizer::drop_control_bytes(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        const auto u = static_cast<unsigned char>(c);
        if ((u < 0x20 && c != '\n' && c != '\t') || u == 0x7F) continue;
        out += c;
    }
    return out;
}

std::string DiagnosticNormalizer::redact(std::string_view in, std::string_view needle,
                                         std::string_view replacement) {
    if (needle.empty()) return std::string(in);

    std::string out;
    out.reserve(in.size());
    size_t pos = 0;
    while (true) {
        const size_t hit = in.find(needle, pos);
        if (hit == std::string_view::npos) {
            out.append(in.substr(pos));
            break;
        }
        out.append(in.substr(pos, hit - pos));
        out.append(replacement);
        pos = hit + needle.size();
    }
    return out;
}

std::string DiagnosticNormalizer::truncate_utf8(std::string text, size_t max_length) {
    if (text.size() <= max_length) return text;

    const bool with_marker = max_length > kTruncationMarker.size();
    size_t keep = with_marker ? max_length - kTruncationMarker.size() : max_length;
    while (keep > 0 && is_utf8_continuation(text[keep])) --keep;

    text.resize(keep);
    if (with_marker) text.append(kTruncationMarker);
    return text;
}

} // namespace codeauditor
