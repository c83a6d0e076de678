#include "log.hpp"

namespace sshprov::test {

bool capture_logger::contains(std::string_view text) const {
	for(auto&& l : lines) {
		if(l.find(text) != std::string::npos) {
			return true;
		}
	}
	return false;
}

void capture_logger::do_log_line(type t, std::string const& s, std::source_location&& loc) {
	lines.push_back(s);
	if(t == logger::error) {
		errors.push_back(s);
	}
	test_log().log_line(t, s, std::move(loc));
}

}
