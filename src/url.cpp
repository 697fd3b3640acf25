#include "http_connector/url.hpp"

#include <algorithm>
#include <cctype>

namespace http_connector {

    namespace url_utils {

        namespace {
            bool is_unreserved(unsigned char c) {
                if (std::isalnum(c)) return true;
                switch (c) {
                    case '-':
                    case '_':
                    case '.':
                    case '!':
                    case '~':
                    case '*':
                    case '\'':
                    case '(':
                    case ')':
                        return true;
                    default:
                        return false;
                }
            }

            int hex_value(char c) {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            }
        }  // namespace

        std::string url_encode(std::string_view s) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s) {
                if (is_unreserved(c)) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        std::string url_decode(std::string_view s) {
            std::string out;
            out.reserve(s.size());
            for (std::size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '+') {
                    out.push_back(' ');
                } else if (s[i] == '%' && i + 2 < s.size() &&
                           hex_value(s[i + 1]) >= 0 &&
                           hex_value(s[i + 2]) >= 0) {
                    out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 +
                                                    hex_value(s[i + 2])));
                    i += 2;
                } else {
                    out.push_back(s[i]);
                }
            }
            return out;
        }

        std::string encode_query(const QueryParams& query) {
            std::string out;
            for (const auto& [k, v] : query) {
                if (!out.empty()) out.push_back('&');
                out += url_encode(k);
                out.push_back('=');
                out += url_encode(v);
            }
            return out;
        }

        QueryParams parse_query(std::string_view query) {
            QueryParams out;
            while (!query.empty()) {
                auto amp = query.find('&');
                std::string_view pair = query.substr(0, amp);
                query = (amp == std::string_view::npos)
                            ? std::string_view{}
                            : query.substr(amp + 1);
                if (pair.empty()) continue;

                auto eq = pair.find('=');
                if (eq == std::string_view::npos) {
                    out[url_decode(pair)] = "";
                } else {
                    out[url_decode(pair.substr(0, eq))] =
                        url_decode(pair.substr(eq + 1));
                }
            }
            return out;
        }

        std::string join_path(std::string_view base, std::string_view path) {
            std::string out;
            out.reserve(base.size() + path.size());
            out.append(base);
            out.append(path);
            if (out.empty()) out = "/";
            return out;
        }

    }  // namespace url_utils

    Result<UrlComponents> parse_url(std::string_view s) {
        auto make_err = [](std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidRequest,
                                              std::move(msg));
        };

        auto sep = s.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return make_err("URL must start with a scheme followed by ://");
        }

        UrlComponents out;
        out.scheme = std::string(s.substr(0, sep));
        std::transform(out.scheme.begin(), out.scheme.end(),
                       out.scheme.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        s.remove_prefix(sep + 3);

        // Split host[:port] from path?query
        std::string_view hostport = s;
        std::string_view rest;
        if (auto slash = s.find_first_of("/?"); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            rest = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        // Port parsing (simple: last ':' splits host/port)
        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) {
                return make_err("URL has empty port");
            }
            if (!std::all_of(out.port.begin(), out.port.end(),
                             [](unsigned char c) { return std::isdigit(c); }) ||
                out.port.size() > 5 || std::stoul(out.port) > 65535) {
                return make_err("URL has invalid port \"" + out.port + "\"");
            }
        } else {
            out.host = std::string(hostport);
        }

        if (out.host.empty()) {
            return make_err("URL has empty host");
        }

        if (auto q = rest.find('?'); q != std::string_view::npos) {
            out.query = url_utils::parse_query(rest.substr(q + 1));
            rest = rest.substr(0, q);
        }
        out.path = std::string(rest);
        if (out.path == "/") out.path.clear();

        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace http_connector
