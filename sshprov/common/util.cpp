#include "util.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace sshprov {

char const encoding[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
char const pad = '=';

static std::uint8_t char_to_value(char c) {
	if(c == 0x2b) // +
		return 0x3e;

	if(c == 0x2f) // /
		return 0x3f;

	if(c >= 0x30 && c <= 0x39) // 0-9
		return 0x34 + (c - 0x30);

	if(c >= 0x41 && c <= 0x5a) // A-Z
		return c - 0x41;

	if(c >= 0x61 && c <= 0x7a) // a-z
		return 0x1a + (c - 0x61);

	return 0xFF; // invalid
}

byte_vector decode_base64(std::string_view s) {
	if(s.empty()) {
		return {};
	}

	byte_vector res;
	res.reserve((s.size() / 4) * 3);

	if((s.size() % 4) == 0) {
		if(s.back() == pad) {
			s.remove_suffix(1);
			if(!s.empty() && s.back() == pad) {
				s.remove_suffix(1);
			}
		}
	}

	for(std::size_t i = 0; i < s.size(); i += 4) {
		auto left = s.size() - i;
		if(left == 1) {
			return {};
		}

		std::uint8_t n1 = char_to_value(s[i]);
		std::uint8_t n2 = char_to_value(s[i+1]);
		if(n1 == 0xFF || n2 == 0xFF) {
			return {};
		}
		res.push_back(std::byte((n1 << 2) | ((n2 & 0x30) >> 4)));

		if(left > 2) {
			std::uint8_t n3 = char_to_value(s[i+2]);
			if(n3 == 0xFF) {
				return {};
			}
			res.push_back(std::byte(((n2 & 0x0f) << 4) | ((n3 & 0x3c) >> 2)));

			if(left > 3) {
				std::uint8_t n4 = char_to_value(s[i+3]);
				if(n4 == 0xFF) {
					return {};
				}
				res.push_back(std::byte(((n3 & 0x03) << 6) | n4));
			}
		}
	}

	return res;
}

std::string encode_base64(const_span s, bool pad) {
	std::string res;
	res.reserve(((s.size()+2)/3)*4);
	for(std::size_t i = 0; i < s.size(); i += 3) {
		auto left = s.size() - i;
		res += encoding[(std::to_integer<std::uint8_t>(s[i]) & 0xfc) >> 2];

		if(left == 1) {
			res += encoding[((std::to_integer<std::uint8_t>(s[i]) & 0x03) << 4)];
			if(pad) {
				res += "==";
			}
		}
		else {
			res += encoding[((std::to_integer<std::uint8_t>(s[i]) & 0x03) << 4)
							| ((std::to_integer<std::uint8_t>(s[i+1]) & 0xf0) >> 4) ];
			if(left == 2) {
				res += encoding[((std::to_integer<std::uint8_t>(s[i+1]) & 0x0f) << 2)];
				if(pad) {
					res += '=';
				}
			} else {
				res += encoding[((std::to_integer<std::uint8_t>(s[i+1]) & 0x0f) << 2)
							| ((std::to_integer<std::uint8_t>(s[i+2]) & 0xc0) >> 6) ];
				res += encoding[(std::to_integer<std::uint8_t>(s[i+2]) & 0x3f)];
			}
		}
	}

	return res;
}

static bool is_space(char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
	while(!s.empty() && is_space(s.front())) {
		s.remove_prefix(1);
	}
	while(!s.empty() && is_space(s.back())) {
		s.remove_suffix(1);
	}
	return s;
}

std::vector<std::string_view> split_lines(std::string_view s) {
	std::vector<std::string_view> res;
	while(!s.empty()) {
		auto pos = s.find('\n');
		if(pos == std::string_view::npos) {
			res.push_back(s);
			break;
		}
		res.push_back(s.substr(0, pos));
		s.remove_prefix(pos+1);
	}
	return res;
}

std::vector<std::string_view> split_words(std::string_view s) {
	std::vector<std::string_view> res;
	std::size_t pos = 0;
	while(pos < s.size()) {
		auto start = s.find_first_not_of(" \t", pos);
		if(start == std::string_view::npos) {
			break;
		}
		auto end = s.find_first_of(" \t", start);
		if(end == std::string_view::npos) {
			end = s.size();
		}
		res.push_back(s.substr(start, end-start));
		pos = end;
	}
	return res;
}

bool iequals(std::string_view a, std::string_view b) {
	if(a.size() != b.size()) {
		return false;
	}
	for(std::size_t i = 0; i != a.size(); ++i) {
		if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

std::optional<std::string> read_file(std::filesystem::path const& file) {
	std::ifstream f(file, std::ios_base::binary);
	if(!f) {
		return std::nullopt;
	}
	std::string content{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
	if(f.bad()) {
		return std::nullopt;
	}
	return content;
}

}
