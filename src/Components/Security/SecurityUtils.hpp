//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.hpp
// Description: Free functions wrapping the OpenSSL primitives that do not need any persistent state.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] OptionalBuffer GenerateRandomData(std::size_t size);
[[nodiscard]] bool GenerateRandomData(WriteableView writeable);

void EraseMemory(void* begin, std::size_t size);

[[nodiscard]] bool ConstantTimeCompare(ReadableView left, ReadableView right);

[[nodiscard]] std::string EncodeBase64(ReadableView data);
[[nodiscard]] OptionalBuffer DecodeBase64(std::string_view encoded);

[[nodiscard]] OptionalBuffer GenerateDigest(ReadableView data);

[[nodiscard]] ReadableView ToReadableView(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
