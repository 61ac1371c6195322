/*
Module Name:
- body_stream.hpp

Abstract:
- Readable, closeable reply body. One is open per logical request at a time;
  whoever holds the BodyStreamPtr owns the underlying connection.
- close() is idempotent and never throws; destructors of implementations
  close as well, so dropping the pointer releases the connection.
- StringBodyStream serves in-memory bodies (HEAD replies, scripted transports).
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>

namespace hop::net
{

    class BodyStream
    {
    public:
        virtual ~BodyStream() = default;

        BodyStream() = default;
        BodyStream(const BodyStream&) = delete;
        BodyStream& operator=(const BodyStream&) = delete;

        // Read up to out.size() bytes. Returns 0 only at end of body.
        [[nodiscard]] virtual std::size_t read_some(std::span<char> out) = 0;

        // True when no body bytes remain. May read ahead.
        [[nodiscard]] virtual bool at_end() = 0;

        virtual void close() noexcept = 0;

        [[nodiscard]] virtual bool is_open() const noexcept = 0;
    };

    using BodyStreamPtr = std::unique_ptr<BodyStream>;

    class StringBodyStream final : public BodyStream
    {
    public:
        explicit StringBodyStream(std::string data = {}) :
            data_{ std::move(data) }
        {
        }

        std::size_t read_some(std::span<char> out) override;
        bool at_end() override
        {
            return !open_ || pos_ == data_.size();
        }
        void close() noexcept override
        {
            open_ = false;
        }
        bool is_open() const noexcept override
        {
            return open_;
        }

    private:
        std::string data_;
        std::size_t pos_{ 0 };
        bool open_{ true };
    };

    // Read at most max bytes (the whole body when max is npos).
    [[nodiscard]] std::string read_string(BodyStream& in, std::size_t max = std::string::npos);

    // Copy the remaining body to out; returns the number of bytes copied.
    std::size_t copy_stream(BodyStream& in, std::ostream& out);

} // namespace hop::net
