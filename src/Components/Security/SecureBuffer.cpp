//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(std::size_t size)
    : m_buffer(size, 0x00)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
    : m_buffer(std::exchange(other.m_buffer, {}))
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer& Security::SecureBuffer::operator=(SecureBuffer&& other) noexcept
{
    if (this != &other) {
        Erase(); // The previous secret must not linger in the released allocation. 
        m_buffer = std::exchange(other.m_buffer, {});
    }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::~SecureBuffer()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SecureBuffer::GetData() const
{
    return m_buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Security::WriteableView Security::SecureBuffer::GetData()
{
    return m_buffer;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::SecureBuffer::GetSize() const
{
    return m_buffer.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::IsEmpty() const
{
    return m_buffer.empty();
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::IsEqual(ReadableView other) const
{
    return ConstantTimeCompare(m_buffer, other);
}

//----------------------------------------------------------------------------------------------------------------------

void Security::SecureBuffer::Erase()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
    m_buffer.clear();
}

//----------------------------------------------------------------------------------------------------------------------
