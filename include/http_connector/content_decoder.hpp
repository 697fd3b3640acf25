#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "result.hpp"

namespace http_connector {

    /**
     * @brief Incremental Content-Encoding decoder for response bodies.
     *
     * gzip and deflate go through zlib; every other encoding (including
     * none) passes bytes through unchanged.
     */
    class ContentDecoder {
       public:
        enum class Kind { Identity, Gzip, Deflate };

        /// @brief Select a decoder from a content-encoding header value.
        /// Matching is case-insensitive and ignores surrounding spaces.
        static ContentDecoder for_encoding(std::string_view content_encoding);

        explicit ContentDecoder(Kind kind);
        ~ContentDecoder();

        ContentDecoder(ContentDecoder&&) noexcept;
        ContentDecoder& operator=(ContentDecoder&&) noexcept;
        ContentDecoder(const ContentDecoder&) = delete;
        ContentDecoder& operator=(const ContentDecoder&) = delete;

        Kind kind() const noexcept { return kind_; }

        /// @brief Decode one chunk and append the output to out.
        /// @return An Error with code DecodingFailed on malformed input.
        Result<std::size_t> feed(std::string_view chunk, std::string& out);

        /// @brief Signal end of input; fails if the compressed stream was
        /// truncated.
        Result<std::size_t> finish(std::string& out);

       private:
        struct Inflater;

        Kind kind_;
        std::unique_ptr<Inflater> inflater_;
    };

}  // namespace http_connector
