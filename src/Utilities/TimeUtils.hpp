//----------------------------------------------------------------------------------------------------------------------
// File: TimeUtils.hpp
// Description: Wall clock helpers shared by the verification components. Protocol timestamps are milliseconds
// since the unix epoch.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/lexical_cast.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace TimeUtils {
//----------------------------------------------------------------------------------------------------------------------

using Timestamp = std::chrono::milliseconds;
using Timepoint = std::chrono::time_point<std::chrono::system_clock, Timestamp>;

// The source of the current time. Injected into time sensitive components so tests can control expiration.
using Clock = std::function<Timepoint()>;

[[nodiscard]] Timepoint GetSystemTimepoint();
[[nodiscard]] Timestamp TimepointToTimestamp(Timepoint const& timepoint);
[[nodiscard]] Timepoint TimestampToTimepoint(std::uint64_t milliseconds);

[[nodiscard]] std::optional<std::chrono::milliseconds> StringToDuration(std::string_view value);
[[nodiscard]] std::optional<std::string> DurationToString(std::chrono::milliseconds const& value);

//----------------------------------------------------------------------------------------------------------------------
} // TimeUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::GetSystemTimepoint()
{
    return std::chrono::time_point_cast<Timestamp>(std::chrono::system_clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::TimepointToTimestamp(Timepoint const& timepoint)
{
    return std::chrono::duration_cast<Timestamp>(timepoint.time_since_epoch());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::TimestampToTimepoint(std::uint64_t milliseconds)
{
    return Timepoint{ Timestamp{ static_cast<Timestamp::rep>(milliseconds) } };
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Parse a duration of the form "<count><unit>" where unit is one of ms, s, min, or h.
//----------------------------------------------------------------------------------------------------------------------
inline std::optional<std::chrono::milliseconds> TimeUtils::StringToDuration(std::string_view value)
{
    auto const first = std::ranges::find_if(value, [] (char c) { return std::isalpha(static_cast<unsigned char>(c)); });
    if (first == value.begin() || first == value.end()) { return {}; } // Both a count and a unit are required.

    std::string_view const count = { value.begin(), first };
    std::string_view const unit = { first, value.end() };

    std::uint64_t parsed = 0;
    if (!boost::conversion::try_lexical_convert(count.data(), count.size(), parsed)) { return {}; }

    if (unit == "ms") { return std::chrono::milliseconds{ parsed }; }
    if (unit == "s") { return std::chrono::seconds{ parsed }; }
    if (unit == "min") { return std::chrono::minutes{ parsed }; }
    if (unit == "h") { return std::chrono::hours{ parsed }; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Write the duration using the largest unit that represents the value exactly.
//----------------------------------------------------------------------------------------------------------------------
inline std::optional<std::string> TimeUtils::DurationToString(std::chrono::milliseconds const& value)
{
    if (value.count() < 0) { return {}; }

    auto const count = static_cast<std::uint64_t>(value.count());
    if (count != 0 && count % 3'600'000 == 0) { return std::to_string(count / 3'600'000) + "h"; }
    if (count != 0 && count % 60'000 == 0) { return std::to_string(count / 60'000) + "min"; }
    if (count != 0 && count % 1'000 == 0) { return std::to_string(count / 1'000) + "s"; }
    return std::to_string(count) + "ms";
}

//----------------------------------------------------------------------------------------------------------------------
