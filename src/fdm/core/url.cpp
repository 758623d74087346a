// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <new>

namespace fdm::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3; // Skip "://"

        // Authority ends at the first of: /, ?, #, or end
        auto host_end = std::min(url_str.find_first_of("/?#", rest_start), url_str.length());

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);
        std::string_view host = authority;
        std::string_view port;

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            host = authority.substr(0, bracket_end + 1);
            auto rest = authority.substr(bracket_end + 1);
            if (!rest.empty() && rest.front() == ':') {
                port = rest.substr(1);
            }
        } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }

        if (host.empty() ||
            !std::all_of(port.begin(), port.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        Url url;
        if (host_end < url_str.length() && url_str[host_end] == '/') {
            auto path_end = std::min(url_str.find_first_of("?#", host_end), url_str.length());
            url.path_ = std::string(url_str.substr(host_end, path_end - host_end));
        } else {
            url.path_ = "/";
        }
        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? std::string_view(path_)
                                                : std::string_view(path_).substr(last_slash + 1);
    return percent_decode(name);
}

std::string sanitize_filename(std::string_view name) {
    // Keep only the last component of either separator style
    auto sep = name.find_last_of("/\\");
    if (sep != std::string_view::npos) {
        name = name.substr(sep + 1);
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|') {
            out += '_';
        } else {
            out += c;
        }
    }

    if (out == "." || out == "..") return {};
    return out;
}

} // namespace fdm::core
