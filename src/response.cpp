#include "http_connector/response.hpp"

#include <algorithm>
#include <cctype>

namespace http_connector {

    ResponseHeaders copy_response_headers(
        const boost::beast::http::fields& in) {
        ResponseHeaders out;
        for (auto const& field : in) {
            std::string name(field.name_string());
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            std::string value(field.value());

            auto [it, inserted] = out.emplace(std::move(name), value);
            if (!inserted) {
                it->second += ", ";
                it->second += value;
            }
        }
        return out;
    }

}  // namespace http_connector
