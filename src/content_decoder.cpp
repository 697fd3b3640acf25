#include "http_connector/content_decoder.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace http_connector {

    namespace {
        constexpr std::size_t chunk_size = 16384;

        // 15 + 32: zlib detects a gzip or zlib header on its own.
        constexpr int auto_header_window_bits = 15 + 32;
        constexpr int raw_deflate_window_bits = -15;

        Result<std::size_t> decoding_error(const std::string& what) {
            return Result<std::size_t>::err(Error::Code::DecodingFailed, what);
        }
    }  // namespace

    struct ContentDecoder::Inflater {
        z_stream stream{};
        bool initialized{false};
        bool raw{false};
        bool ended{false};
        bool saw_input{false};
        // A finished member was followed by a lone 0x1f; the next chunk
        // decides whether it starts another gzip member.
        bool pending_magic{false};
        // Input kept until the first output byte so a headerless deflate
        // body can be replayed through a raw inflater.
        std::string replay;
        bool produced_output{false};

        ~Inflater() { reset(); }

        bool init(int window_bits) {
            reset();
            stream = z_stream{};
            initialized = inflateInit2(&stream, window_bits) == Z_OK;
            ended = false;
            return initialized;
        }

        void reset() {
            if (initialized) inflateEnd(&stream);
            initialized = false;
        }

        std::string last_message(const char* fallback) const {
            return stream.msg ? std::string(stream.msg) : std::string(fallback);
        }
    };

    ContentDecoder ContentDecoder::for_encoding(
        std::string_view content_encoding) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!content_encoding.empty() && is_space(content_encoding.front()))
            content_encoding.remove_prefix(1);
        while (!content_encoding.empty() && is_space(content_encoding.back()))
            content_encoding.remove_suffix(1);

        std::string lower(content_encoding);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (lower == "gzip") return ContentDecoder(Kind::Gzip);
        if (lower == "deflate") return ContentDecoder(Kind::Deflate);
        return ContentDecoder(Kind::Identity);
    }

    ContentDecoder::ContentDecoder(Kind kind) : kind_(kind) {
        if (kind_ != Kind::Identity) {
            inflater_ = std::make_unique<Inflater>();
        }
    }

    ContentDecoder::~ContentDecoder() = default;
    ContentDecoder::ContentDecoder(ContentDecoder&&) noexcept = default;
    ContentDecoder& ContentDecoder::operator=(ContentDecoder&&) noexcept =
        default;

    Result<std::size_t> ContentDecoder::feed(std::string_view chunk,
                                             std::string& out) {
        if (kind_ == Kind::Identity) {
            out.append(chunk);
            return Result<std::size_t>::ok(chunk.size());
        }
        if (chunk.empty()) return Result<std::size_t>::ok(std::size_t{0});

        auto& z = *inflater_;
        if (!z.initialized && !z.ended) {
            if (!z.init(auto_header_window_bits)) {
                return decoding_error("zlib initialization failed");
            }
        }
        z.saw_input = true;
        if (!z.produced_output && kind_ == Kind::Deflate && !z.raw) {
            z.replay.append(chunk);
        }

        std::string joined;
        if (z.pending_magic) {
            z.pending_magic = false;
            joined.reserve(chunk.size() + 1);
            joined.push_back('\x1f');
            joined.append(chunk);
            chunk = joined;
        }

        std::array<unsigned char, chunk_size> buf{};
        const std::size_t before = out.size();

        z.stream.next_in =
            reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
        z.stream.avail_in = static_cast<uInt>(chunk.size());

        for (;;) {
            if (z.ended) {
                if (z.stream.avail_in == 0) break;
                // Another gzip member follows; anything else is trailing
                // garbage and is dropped.
                if (z.stream.avail_in >= 2 && z.stream.next_in[0] == 0x1f &&
                    z.stream.next_in[1] == 0x8b) {
                    if (inflateReset(&z.stream) != Z_OK) {
                        return decoding_error("zlib reset failed");
                    }
                    z.ended = false;
                } else if (z.stream.avail_in == 1 &&
                           z.stream.next_in[0] == 0x1f) {
                    z.pending_magic = true;
                    z.stream.avail_in = 0;
                    break;
                } else {
                    z.stream.avail_in = 0;
                    break;
                }
            }

            z.stream.next_out = buf.data();
            z.stream.avail_out = static_cast<uInt>(buf.size());

            int ret = inflate(&z.stream, Z_NO_FLUSH);

            if (ret == Z_DATA_ERROR && kind_ == Kind::Deflate && !z.raw &&
                !z.produced_output) {
                // Headerless deflate: restart as raw DEFLATE over everything
                // seen so far.
                std::string replay = std::move(z.replay);
                z.replay.clear();
                if (!z.init(raw_deflate_window_bits)) {
                    return decoding_error("zlib initialization failed");
                }
                z.raw = true;
                out.resize(before);
                auto again = feed(replay, out);
                if (again.has_error()) return again;
                return Result<std::size_t>::ok(out.size() - before);
            }

            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                return decoding_error(z.last_message("invalid compressed data"));
            }

            const std::size_t have = buf.size() - z.stream.avail_out;
            if (have > 0) {
                out.append(reinterpret_cast<const char*>(buf.data()), have);
                z.produced_output = true;
                z.replay.clear();
            }

            if (ret == Z_STREAM_END) {
                z.ended = true;
                continue;
            }
            // Input consumed and zlib has nothing buffered for us.
            if (z.stream.avail_in == 0 && z.stream.avail_out != 0) break;
            if (ret == Z_BUF_ERROR && have == 0) break;
        }

        return Result<std::size_t>::ok(out.size() - before);
    }

    Result<std::size_t> ContentDecoder::finish(std::string& out) {
        (void)out;
        if (kind_ == Kind::Identity) return Result<std::size_t>::ok(std::size_t{0});

        auto& z = *inflater_;
        if (!z.saw_input || z.ended) {
            z.reset();
            return Result<std::size_t>::ok(std::size_t{0});
        }
        z.reset();
        return decoding_error("unexpected end of file");
    }

}  // namespace http_connector
