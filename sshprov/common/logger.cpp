#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace sshprov {

void stdout_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	std::puts(s.c_str());
}

void stderr_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	std::fputs(s.c_str(), stderr);
	std::fputc('\n', stderr);
}

session_logger::session_logger(logger& l, std::string tag)
: logger(log_all)
, log_(l)
, tag_(std::move(tag))
{}

void session_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
