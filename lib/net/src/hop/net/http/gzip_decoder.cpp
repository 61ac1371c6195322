// C++ Standard Library
#include <cctype>
#include <string>

// Zlib
#include <zlib.h>

// Project
#include <hop/net/http/encoding.hpp>
#include <hop/utils/attributes.hpp>
#include <hop/utils/case_insensitive.hpp>

namespace hop::net::encoding {

namespace {
    inline void trim(std::string_view& sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
    }
} // namespace

enc parse_content_encoding(std::string_view value)
{
    enc result = enc::none;
    while (!value.empty()) {
        const auto comma = value.find(',');
        std::string_view token = (comma == std::string_view::npos) ? value : value.substr(0, comma);
        value = (comma == std::string_view::npos) ? std::string_view{} : value.substr(comma + 1);
        trim(token);
        if (token.empty())
            continue;
        if (utils::iequals(token, "gzip") || utils::iequals(token, "x-gzip"))
            result = result | enc::gzip;
        else if (utils::iequals(token, "deflate"))
            result = result | enc::deflate;
        // identity and unknown tokens: nothing to undo
    }
    return result;
}

struct InflateBodyStream::inflater {
    z_stream zs{};
    bool initialised{false};

    explicit inflater(int window_bits)
    {
        if (inflateInit2(&zs, window_bits) != Z_OK) {
            throw HttpError{errc::decompression_failure, "inflateInit2 failed"};
        }
        initialised = true;
    }
    ~inflater()
    {
        if (initialised) inflateEnd(&zs);
    }
    inflater(const inflater&) = delete;
    inflater& operator=(const inflater&) = delete;
};

InflateBodyStream::InflateBodyStream(BodyStreamPtr inner, enc format)
    : inner_{std::move(inner)}
    // 16 + MAX_WBITS: expect a gzip wrapper; MAX_WBITS: expect a zlib wrapper
    , z_{std::make_unique<inflater>(format == enc::gzip ? 16 + MAX_WBITS : MAX_WBITS)}
{
}

InflateBodyStream::~InflateBodyStream()
{
    close();
}

std::size_t InflateBodyStream::read_some(std::span<char> out)
{
    if (out.empty()) return 0;

    std::size_t produced = 0;
    if (has_peeked_) {
        out[0] = peeked_;
        has_peeked_ = false;
        produced = 1;
        out = out.subspan(1);
    }

    auto& zs = z_->zs;
    while (!finished_ && !out.empty()) {
        if (zs.avail_in == 0) {
            const auto n = inner_->read_some(in_buf_);
            if (HOP_UNLIKELY(n == 0)) {
                // nothing was ever sent, e.g. a 204 that still names an encoding
                if (!received_input_) {
                    finished_ = true;
                    break;
                }
                throw HttpError{errc::decompression_failure, "truncated compressed body"};
            }
            received_input_ = true;
            zs.next_in = reinterpret_cast<Bytef*>(in_buf_.data());
            zs.avail_in = static_cast<uInt>(n);
        }

        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = static_cast<uInt>(out.size());
        const int ret = inflate(&zs, Z_NO_FLUSH);
        if (HOP_UNLIKELY(ret != Z_OK && ret != Z_STREAM_END)) {
            throw HttpError{errc::decompression_failure, "corrupt compressed body"};
        }

        const std::size_t n = out.size() - zs.avail_out;
        produced += n;
        out = out.subspan(n);
        if (ret == Z_STREAM_END) finished_ = true;
        if (n != 0) break; // hand back what we have
    }
    return produced;
}

bool InflateBodyStream::at_end()
{
    if (has_peeked_) return false;
    if (finished_) return true;
    char c{};
    if (read_some(std::span<char>{&c, 1}) == 0) return true;
    peeked_ = c;
    has_peeked_ = true;
    return false;
}

void InflateBodyStream::close() noexcept
{
    if (inner_) inner_->close();
}

bool InflateBodyStream::is_open() const noexcept
{
    return inner_ && inner_->is_open();
}

BodyStreamPtr decode(BodyStreamPtr body, enc which)
{
    if ((which & enc::gzip) == enc::gzip) {
        body = std::make_unique<InflateBodyStream>(std::move(body), enc::gzip);
    }
    if ((which & enc::deflate) == enc::deflate) {
        body = std::make_unique<InflateBodyStream>(std::move(body), enc::deflate);
    }
    return body;
}

} // namespace hop::net::encoding
