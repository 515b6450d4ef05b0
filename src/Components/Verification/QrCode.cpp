//----------------------------------------------------------------------------------------------------------------------
// File: QrCode.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "QrCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::QrCode(
    Mode mode,
    std::string_view transactionId,
    PublicKey const& firstKey,
    PublicKey const& secondKey,
    Security::ReadableView secret)
    : m_mode(mode)
    , m_transactionId(transactionId)
    , m_firstKey(firstKey)
    , m_secondKey(secondKey)
    , m_secret(secret)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::QrCode::operator==(QrCode const& other) const
{
    return m_mode == other.m_mode && m_transactionId == other.m_transactionId && m_firstKey == other.m_firstKey &&
        m_secondKey == other.m_secondKey && m_secret.IsEqual(other.m_secret.GetData());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::QrCode> Verification::QrCode::Decode(Security::ReadableView payload)
{
    constexpr std::size_t KeysSize = 2 * Security::Ed25519KeySize;
    if (payload.size() < HeaderSize) { return {}; }

    auto begin = payload.begin();
    if (!std::equal(Magic.begin(), Magic.end(), begin)) { return {}; }
    begin += Magic.size();

    if (*begin++ != Version) { return {}; }

    auto const mode = *begin++;
    if (mode > static_cast<std::uint8_t>(Mode::CrossUser)) { return {}; }

    std::size_t const size = (static_cast<std::size_t>(*begin) << 8) | static_cast<std::size_t>(*(begin + 1));
    begin += sizeof(std::uint16_t);

    // The transaction id must be followed by both keys and a secret of at least the minimum size.
    std::size_t const remaining = static_cast<std::size_t>(std::distance(begin, payload.end()));
    if (size == 0 || remaining < size + KeysSize + MinimumSecretSize) { return {}; }

    std::string_view const transactionId{ reinterpret_cast<char const*>(&*begin), size };
    begin += size;

    PublicKey firstKey;
    std::copy_n(begin, firstKey.size(), firstKey.begin());
    begin += firstKey.size();

    PublicKey secondKey;
    std::copy_n(begin, secondKey.size(), secondKey.begin());
    begin += secondKey.size();

    return QrCode{ static_cast<Mode>(mode), transactionId, firstKey, secondKey, { begin, payload.end() } };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::Buffer> Verification::QrCode::Encode() const
{
    if (m_transactionId.empty() || m_transactionId.size() > std::numeric_limits<std::uint16_t>::max()) { return {}; }
    auto const secret = m_secret.GetData();
    if (secret.size() < MinimumSecretSize) { return {}; }

    Security::Buffer payload;
    payload.reserve(HeaderSize + m_transactionId.size() + m_firstKey.size() + m_secondKey.size() + secret.size());
    payload.insert(payload.end(), Magic.begin(), Magic.end());
    payload.emplace_back(Version);
    payload.emplace_back(static_cast<std::uint8_t>(m_mode));
    payload.emplace_back(static_cast<std::uint8_t>((m_transactionId.size() >> 8) & 0xFF));
    payload.emplace_back(static_cast<std::uint8_t>(m_transactionId.size() & 0xFF));
    payload.insert(payload.end(), m_transactionId.begin(), m_transactionId.end());
    payload.insert(payload.end(), m_firstKey.begin(), m_firstKey.end());
    payload.insert(payload.end(), m_secondKey.begin(), m_secondKey.end());
    payload.insert(payload.end(), secret.begin(), secret.end());
    return payload;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::Mode Verification::QrCode::GetMode() const { return m_mode; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Verification::QrCode::GetTransactionId() const { return m_transactionId; }

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::PublicKey const& Verification::QrCode::GetFirstKey() const { return m_firstKey; }

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::PublicKey const& Verification::QrCode::GetSecondKey() const { return m_secondKey; }

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Verification::QrCode::GetSecret() const { return m_secret.GetData(); }

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrCode::Erase() { m_secret.Erase(); }

//----------------------------------------------------------------------------------------------------------------------
