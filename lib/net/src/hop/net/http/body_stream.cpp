// C++ Standard Library
#include <algorithm>
#include <array>
#include <cstring>
#include <ostream>
#include <stdexcept>

// Project
#include <hop/net/http/body_stream.hpp>
#include <hop/utils/attributes.hpp>

namespace hop::net
{

    namespace
    {
        inline constexpr std::size_t k_copy_chunk = 16 * 1024;
    }

    std::size_t StringBodyStream::read_some(std::span<char> out)
    {
        if (HOP_UNLIKELY(!open_))
            throw std::logic_error("read from closed body stream");
        const auto n = std::min(out.size(), data_.size() - pos_);
        std::memcpy(out.data(), data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    std::string read_string(BodyStream& in, std::size_t max)
    {
        std::string out;
        std::array<char, k_copy_chunk> buf{};
        while (out.size() < max)
        {
            const auto want = std::min(buf.size(), max - out.size());
            const auto n = in.read_some(std::span<char>{ buf.data(), want });
            if (n == 0)
                break;
            out.append(buf.data(), n);
        }
        return out;
    }

    std::size_t copy_stream(BodyStream& in, std::ostream& out)
    {
        std::array<char, k_copy_chunk> buf{};
        std::size_t total = 0;
        for (;;)
        {
            const auto n = in.read_some(buf);
            if (HOP_UNLIKELY(n == 0))
                break;
            out.write(buf.data(), static_cast<std::streamsize>(n));
            if (!out)
                throw std::runtime_error("write failed while copying reply body");
            total += n;
        }
        return total;
    }

} // namespace hop::net
