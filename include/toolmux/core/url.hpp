#pragma once

#include <toolmux/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace toolmux {

// ---------------------------------------------------------------------------
// HttpUrl — validated absolute http(s) URL split into its parts.
//
// Rules:
//   - Scheme must be http or https
//   - Host must be non-empty; an explicit port must be 1..65535
//   - Path defaults to "/" and keeps its query string
// ---------------------------------------------------------------------------
class HttpUrl {
public:
    static Result<HttpUrl, std::string> Parse(std::string_view url);

    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] bool IsHttps() const noexcept { return scheme_ == "https"; }

    /// "scheme://host:port", the form httplib::Client accepts.
    [[nodiscard]] std::string Origin() const;

    /// Resolve a reference received from the server: absolute URLs replace
    /// this one, "/path" keeps the origin, anything else is relative to the
    /// directory of Path().
    [[nodiscard]] Result<HttpUrl, std::string> Resolve(std::string_view ref) const;

    bool operator==(const HttpUrl& other) const {
        return scheme_ == other.scheme_ && host_ == other.host_ &&
               port_ == other.port_ && path_ == other.path_;
    }
    bool operator!=(const HttpUrl& other) const { return !(*this == other); }

private:
    HttpUrl(std::string scheme, std::string host, uint16_t port, std::string path)
        : scheme_(std::move(scheme)), host_(std::move(host)),
          port_(port), path_(std::move(path)) {}

    std::string scheme_;
    std::string host_;
    uint16_t port_;
    std::string path_;
};

} // namespace toolmux
