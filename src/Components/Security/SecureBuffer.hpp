//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.hpp
// Description: A move-only byte buffer for handshake secrets. The contents are scrubbed when the buffer is erased,
// overwritten by a move, or destroyed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <optional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SecureBuffer;

using OptionalSecureBuffer = std::optional<Security::SecureBuffer>;

template <typename Buffer>
concept ByteLikeBuffer = std::same_as<std::remove_cv_t<typename Buffer::value_type>, std::uint8_t> ||
                         std::same_as<std::remove_cv_t<typename Buffer::value_type>, char>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SecureBuffer
{
public:
    SecureBuffer() = default;
    explicit SecureBuffer(std::size_t size);

    template <typename... Buffers>
    explicit SecureBuffer(Buffers const&... buffers) requires (sizeof...(Buffers) != 0 && (ByteLikeBuffer<Buffers> && ...))
    {
        std::size_t const total = (buffers.size() + ...);
        m_buffer.reserve(total);
        (m_buffer.insert(m_buffer.end(), buffers.begin(), buffers.end()), ...);
    }

    SecureBuffer(SecureBuffer const&) = delete;
    SecureBuffer& operator=(SecureBuffer const&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    ~SecureBuffer();

    [[nodiscard]] ReadableView GetData() const;
    [[nodiscard]] WriteableView GetData();
    [[nodiscard]] std::size_t GetSize() const;
    [[nodiscard]] bool IsEmpty() const;

    // Compares the contents in constant time with respect to the data. 
    [[nodiscard]] bool IsEqual(ReadableView other) const;

    void Erase();
    
private:
    Buffer m_buffer;
};

//----------------------------------------------------------------------------------------------------------------------
