#include "key_material.hpp"
#include "sshprov/common/util.hpp"

namespace sshprov {

// "\r\n", "\r" and "\n" all end a line
static std::vector<std::string_view> split_key_lines(std::string_view s) {
	std::vector<std::string_view> res;
	while(!s.empty()) {
		auto pos = s.find_first_of("\r\n");
		if(pos == std::string_view::npos) {
			res.push_back(s);
			break;
		}
		res.push_back(s.substr(0, pos));
		std::size_t skip = (s[pos] == '\r' && pos+1 < s.size() && s[pos+1] == '\n') ? 2 : 1;
		s.remove_prefix(pos+skip);
	}
	return res;
}

std::string normalize_key(std::string_view blob) {
	std::string res;
	for(auto line : split_key_lines(blob)) {
		res += trim(line);
		res += '\n';
	}

	// same as stripping the joined text, inner blank lines are kept
	auto first = res.find_first_not_of('\n');
	if(first == std::string::npos) {
		return {};
	}
	auto last = res.find_last_not_of('\n');
	return res.substr(first, last - first + 1) + '\n';
}

key_material::key_material(std::string text)
: text_(std::move(text))
{
}

std::optional<key_material> key_material::from_secret(std::string_view blob) {
	std::string text = normalize_key(blob);
	if(text.empty()) {
		return std::nullopt;
	}
	return key_material(std::move(text));
}

std::vector<std::string_view> key_material::lines() const {
	return split_lines(text_);
}

std::string_view key_material::header() const {
	return std::string_view(text_).substr(0, text_.find('\n'));
}

}
