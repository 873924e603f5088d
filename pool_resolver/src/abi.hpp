#pragma once
#include <cstdint>
#include <string>

// Minimal Solidity ABI helpers for eth_call payloads and results.
// Hex arguments may carry a 0x prefix unless noted otherwise.
namespace abi {

std::string strip_0x(const std::string& hex);
std::string ensure_0x(const std::string& hex);

// Left-pads hex (no prefix) to one 32-byte word
std::string pad32(const std::string& hex_no_prefix);

std::string encode_address(const std::string& address);
std::string encode_uint(uint64_t value);

// Selector followed by the encoded arguments
std::string call_data(const std::string& selector, const std::string& encoded_args = "");

// 32-byte word `index` of a call result, without prefix; throws std::runtime_error if short
std::string word(const std::string& result, size_t index);

std::string decode_address(const std::string& word_hex);
uint64_t decode_uint64(const std::string& word_hex);

// Two's complement int24 in the low bytes of the word (ticks, tick spacing)
int32_t decode_int24(const std::string& word_hex);

// Arbitrary-width unsigned hex to a decimal string (uint128, uint160, uint256)
std::string hex_to_decimal(const std::string& hex);

// ABI `string` return, or a right-padded bytes32 for legacy tokens
std::string decode_string(const std::string& result);

bool is_zero_address(const std::string& address);

} // namespace abi
