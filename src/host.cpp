#include "http_connector/host.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "http_connector/error.hpp"

namespace http_connector {

    Protocol parse_protocol(std::string_view protocol) {
        std::string p(protocol);
        std::transform(p.begin(), p.end(), p.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (!p.empty() && p.back() == ':') p.pop_back();

        if (p == "http") return Protocol::Http;
        if (p == "https") return Protocol::Https;
        throw UnsupportedProtocolError(std::string(protocol));
    }

    Result<Host> Host::from_url(std::string_view url) {
        auto parsed = parse_url(url);
        if (parsed.has_error()) return Result<Host>::err(parsed.error());

        UrlComponents u = std::move(parsed).value();

        Host h;
        h.protocol = std::move(u.scheme);
        h.host = std::move(u.host);
        h.port = u.port.empty() ? 0 : static_cast<std::uint16_t>(std::stoul(u.port));
        h.path = std::move(u.path);
        h.query = std::move(u.query);
        return Result<Host>::ok(std::move(h));
    }

    Headers Host::get_headers(const Headers& overrides) const {
        Headers out = headers;
        for (const auto& [name, value] : overrides) {
            // Drop any differently-cased spelling before inserting.
            out.erase(name);
            out.emplace(name, value);
        }
        return out;
    }

    std::optional<QueryParams> Host::get_query(
        const QueryParams& overrides) const {
        QueryParams out = query;
        for (const auto& [k, v] : overrides) out[k] = v;
        if (out.empty()) return std::nullopt;
        return out;
    }

    std::uint16_t Host::effective_port() const {
        if (port != 0) return port;
        std::string p = protocol;
        std::transform(p.begin(), p.end(), p.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return (p == "https" || p == "https:") ? 443 : 80;
    }

    std::string Host::key() const {
        return host + ":" + std::to_string(effective_port()) + ":";
    }

}  // namespace http_connector
