#include "parafetch/filename_sanitizer.hpp"

#include "parafetch/detail/curl_utils.hpp"
#include "parafetch/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>
#include <system_error>

#include <fmt/format.h>

namespace parafetch {

namespace {

constexpr int kMaxDecodeRounds = 3;
constexpr std::size_t kMaxFilenameBytes = 255;

bool isTrimmed(char c) {
    return c == '.' || std::isspace(static_cast<unsigned char>(c));
}

bool isReserved(char c) {
    switch (c) {
    case '/':
    case '\\':
    case '<':
    case '>':
    case ':':
    case '"':
    case '|':
    case '?':
    case '*':
        return true;
    default:
        return false;
    }
}

std::string decodeFully(std::string_view raw) {
    std::string current{raw};
    for (int round = 0; round < kMaxDecodeRounds; ++round) {
        if (current.find('%') == std::string::npos) {
            break;
        }
        std::string decoded = detail::percentDecode(current);
        if (decoded == current) {
            break;
        }
        current = std::move(decoded);
    }
    return current;
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isTrimmed(text[begin])) {
        ++begin;
    }
    while (end > begin && isTrimmed(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Largest cut <= limit that does not split a UTF-8 sequence.
std::size_t utf8Boundary(const std::string& text, std::size_t limit) {
    std::size_t cut = std::min(limit, text.size());
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto result = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
    if (ec) {
        return std::filesystem::absolute(path).lexically_normal();
    }
    return result;
}

} // namespace

std::string sanitizeFilename(std::string_view raw) {
    const std::string decoded = decodeFully(raw);

    std::string cleaned;
    cleaned.reserve(decoded.size());
    for (const char c : decoded) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            continue;
        }
        cleaned.push_back(isReserved(c) ? '_' : c);
    }

    std::string name = trim(cleaned);
    if (name.size() > kMaxFilenameBytes) {
        name = trim(name.substr(0, utf8Boundary(name, kMaxFilenameBytes)));
    }
    if (name.empty()) {
        return randomFallbackName();
    }
    return name;
}

std::string filenameFromUrl(const std::string& url) {
    return sanitizeFilename(detail::urlLastSegment(url));
}

std::string randomFallbackName() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    return fmt::format("download_{:08x}", dist(engine));
}

bool isDirectChild(const std::filesystem::path& directory, const std::filesystem::path& candidate) {
    // A link may point anywhere, including at a path that does not exist yet.
    std::error_code ec;
    if (std::filesystem::is_symlink(candidate, ec)) {
        return false;
    }

    const auto dir = normalized(directory);
    const auto file = normalized(candidate);
    return file.has_filename() && file.parent_path() == dir;
}

std::filesystem::path resolveDestination(const std::filesystem::path& directory, const std::string& name) {
    auto destination = directory / name;
    if (isDirectChild(directory, destination)) {
        return destination;
    }

    auto fallback = randomFallbackName();
    logger()->warn("unsafe filename replaced filename={} fallback={}", name, fallback);
    return directory / fallback;
}

} // namespace parafetch
