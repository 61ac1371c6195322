// C++ Standard Library
#include <array>
#include <charconv>

// Project
#include <hop/net/http/accept.hpp>
#include <hop/net/http/error.hpp>

namespace hop::net {

namespace {
    // ";q=0.333"
    void append_weight(std::string& out, double q)
    {
        std::array<char, 16> buf{};
        const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), q, std::chars_format::fixed, 3);
        out += ";q=";
        out.append(buf.data(), res.ptr);
    }

    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string accept_value(std::span<const mime::media_type> ranked)
{
    if (ranked.empty()) {
        throw HttpError{errc::empty_accept, "cannot build an Accept header from no media types"};
    }

    const auto n = ranked.size();
    std::string out;
    out.reserve(n * 32);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) out += ", ";
        out += ranked[i].to_string();
        append_weight(out, static_cast<double>(i + 1) / static_cast<double>(n));
    }
    return out;
}

std::string accept_value(const AcceptOption& option)
{
    return std::visit(overloaded{
                          [](std::monostate) { return std::string{k_accept_any}; },
                          [](const Extension& ext) {
                              auto mt = mime::from_extension(ext.name);
                              if (!mt) {
                                  throw HttpError{errc::unknown_extension,
                                                  "no media type registered for extension '" + ext.name + "'"};
                              }
                              return accept_value(std::span<const mime::media_type>{&*mt, 1});
                          },
                          [](const mime::media_type& mt) {
                              return accept_value(std::span<const mime::media_type>{&mt, 1});
                          },
                          [](const std::vector<mime::media_type>& list) {
                              return accept_value(std::span<const mime::media_type>{list});
                          },
                      },
                      option);
}

} // namespace hop::net
