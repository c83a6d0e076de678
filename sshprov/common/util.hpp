#ifndef SSHPROV_COMMON_UTIL_HEADER
#define SSHPROV_COMMON_UTIL_HEADER

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace sshprov {

/// returns empty vector for invalid input, padding is optional
byte_vector decode_base64(std::string_view);
std::string encode_base64(const_span, bool pad = false);

/// strips spaces, tabs, carriage returns and other whitespace from both ends
std::string_view trim(std::string_view);

/// splits on '\n', a trailing '\r' is kept as part of the line
std::vector<std::string_view> split_lines(std::string_view);

/// splits on runs of spaces and tabs
std::vector<std::string_view> split_words(std::string_view);

bool iequals(std::string_view, std::string_view);

/// whole file as text, nullopt if it cannot be opened or read
std::optional<std::string> read_file(std::filesystem::path const&);

}

#endif
