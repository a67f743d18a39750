#include <toolmux/core/url.hpp>

#include <cctype>

namespace toolmux {

namespace {

bool AllDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

Result<HttpUrl, std::string> HttpUrl::Parse(std::string_view url) {
    if (url.empty()) {
        return Result<HttpUrl, std::string>::Err("URL must not be empty");
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<HttpUrl, std::string>::Err(
            "URL must start with http:// or https://");
    }
    std::string scheme(url.substr(0, scheme_end));
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (scheme != "http" && scheme != "https") {
        return Result<HttpUrl, std::string>::Err(
            "Unsupported URL scheme '" + scheme + "'");
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    std::string path = path_start == std::string_view::npos
        ? std::string("/")
        : std::string(rest.substr(path_start));
    if (!path.empty() && path[0] == '?') {
        path.insert(0, "/");
    }

    if (authority.find('@') != std::string_view::npos) {
        return Result<HttpUrl, std::string>::Err(
            "URL must not carry user info");
    }

    std::string_view host = authority;
    uint16_t port = scheme == "https" ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        auto port_str = authority.substr(colon + 1);
        if (!AllDigits(port_str) || port_str.size() > 5) {
            return Result<HttpUrl, std::string>::Err(
                "Invalid port '" + std::string(port_str) + "'");
        }
        auto value = std::stoi(std::string(port_str));
        if (value <= 0 || value > 65535) {
            return Result<HttpUrl, std::string>::Err(
                "Port out of range: " + std::string(port_str));
        }
        port = static_cast<uint16_t>(value);
    }
    if (host.empty()) {
        return Result<HttpUrl, std::string>::Err("URL must have a host");
    }

    return Result<HttpUrl, std::string>::Ok(
        HttpUrl(std::move(scheme), std::string(host), port, std::move(path)));
}

std::string HttpUrl::Origin() const {
    return scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

Result<HttpUrl, std::string> HttpUrl::Resolve(std::string_view ref) const {
    if (ref.empty()) {
        return Result<HttpUrl, std::string>::Err("Empty URL reference");
    }
    if (ref.find("://") != std::string_view::npos) {
        return Parse(ref);
    }
    if (ref[0] == '/') {
        return Result<HttpUrl, std::string>::Ok(
            HttpUrl(scheme_, host_, port_, std::string(ref)));
    }
    auto base = path_.substr(0, path_.find('?'));
    base = base.substr(0, base.rfind('/') + 1);
    return Result<HttpUrl, std::string>::Ok(
        HttpUrl(scheme_, host_, port_, base + std::string(ref)));
}

} // namespace toolmux
