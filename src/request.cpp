#include "http_connector/request.hpp"

#include <boost/beast/http/field.hpp>

namespace http_connector {

    namespace http = boost::beast::http;

    RequestTarget make_request_target(const Host& host, Protocol protocol,
                                      const RequestParams& params) {
        RequestTarget t;
        t.method = params.method;
        t.protocol = protocol;
        t.hostname = host.host;
        t.port = host.effective_port();
        t.path = url_utils::join_path(host.path, params.path);
        t.headers = host.get_headers(params.headers);

        if (auto query = host.get_query(params.query)) {
            t.path += '?';
            t.path += url_utils::encode_query(*query);
        }
        return t;
    }

    http::request<http::string_body> prepare_beast_request(
        const RequestTarget& target, const std::optional<std::string>& body,
        std::string_view user_agent, bool keep_alive) {
        http::request<http::string_body> req;
        req.version(11);
        req.method(to_beast_verb(target.method));
        req.target(target.path);

        const bool default_port =
            (target.protocol == Protocol::Http && target.port == 80) ||
            (target.protocol == Protocol::Https && target.port == 443);
        req.set(http::field::host,
                default_port ? target.hostname
                             : target.hostname + ":" +
                                   std::to_string(target.port));
        if (!user_agent.empty()) {
            req.set(http::field::user_agent,
                    boost::beast::string_view(user_agent.data(),
                                              user_agent.size()));
        }
        req.keep_alive(keep_alive);

        // Uses set(), so caller headers replace the defaults above.
        for (const auto& [name, value] : target.headers) {
            req.set(name, value);
        }

        if (body) {
            req.body() = *body;
            req.set(http::field::content_length,
                    std::to_string(body->size()));
        } else {
            req.set(http::field::content_length, "0");
        }
        return req;
    }

}  // namespace http_connector
