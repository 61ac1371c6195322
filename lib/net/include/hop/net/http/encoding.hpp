#pragma once

// C++ Standard Library
#include <array>
#include <memory>
#include <string_view>

// Project
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/error.hpp>

namespace hop::net::encoding {

// bitmask of recognised encodings
enum class enc : unsigned {
    none = 0,
    gzip = 1u << 0,
    deflate = 1u << 1, // zlib-wrapped
};

constexpr enc operator|(enc a, enc b)
{
    return static_cast<enc>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}
constexpr enc operator&(enc a, enc b)
{
    return static_cast<enc>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

// Parse a Content-Encoding header like: "gzip" or "x-gzip, identity"
[[nodiscard]] enc parse_content_encoding(std::string_view value);

// Inflates a gzip- or deflate-encoded body while it is read. Throws
// HttpError(decompression_failure) on corrupt or truncated input. An inner
// stream that ends before yielding a single byte is an empty body.
class InflateBodyStream final : public BodyStream {
public:
    // format is enc::gzip or enc::deflate
    InflateBodyStream(BodyStreamPtr inner, enc format);
    ~InflateBodyStream() override;

    std::size_t read_some(std::span<char> out) override;
    bool at_end() override;
    void close() noexcept override;
    bool is_open() const noexcept override;

private:
    struct inflater;

    BodyStreamPtr inner_;
    std::unique_ptr<inflater> z_;
    std::array<char, 16 * 1024> in_buf_{};
    // One decoded byte held back by at_end().
    char peeked_{};
    bool has_peeked_{false};
    bool received_input_{false};
    bool finished_{false};
};

// Wrap in a decoder when the encoding requires one. Encodings are undone
// gzip first, then deflate.
[[nodiscard]] BodyStreamPtr decode(BodyStreamPtr body, enc which);

} // namespace hop::net::encoding
