#include "pfetch/detail/destination.hpp"

#include <cctype>
#include <string>
#include <string_view>

namespace pfetch::detail {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

// Keeps the name on a single path component of a POSIX or Windows file system.
std::string sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::iscntrl(uc) || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|') {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string filenameFromUrl(const std::string& url) {
    std::string_view view{url};

    const auto cut = view.find_first_of("?#");
    if (cut != std::string_view::npos) {
        view = view.substr(0, cut);
    }

    // Skip "scheme://authority"; a bare host has no path segment.
    const auto scheme = view.find("://");
    if (scheme != std::string_view::npos) {
        const auto path_start = view.find('/', scheme + 3);
        if (path_start == std::string_view::npos) {
            return {};
        }
        view = view.substr(path_start);
    }

    const auto slash = view.find_last_of('/');
    const std::string_view segment = slash == std::string_view::npos ? view : view.substr(slash + 1);

    std::string name = sanitize(percentDecode(segment));
    if (name.empty() || name == "." || name == "..") {
        return {};
    }
    return name;
}

std::string fallbackFilename(std::size_t sequence) {
    return "download_" + std::to_string(sequence);
}

std::filesystem::path uniquePath(const std::filesystem::path& candidate,
                                 const std::function<bool(const std::filesystem::path&)>& is_taken) {
    if (!is_taken(candidate)) {
        return candidate;
    }

    const std::string stem = candidate.stem().string();
    const std::string extension = candidate.extension().string();

    for (std::size_t counter = 1;; ++counter) {
        auto next = candidate.parent_path() / (stem + "__" + std::to_string(counter) + extension);
        if (!is_taken(next)) {
            return next;
        }
    }
}

} // namespace pfetch::detail
