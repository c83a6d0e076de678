#include "util.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <stdlib.h>

namespace sshprov::test {

temp_dir::temp_dir() {
	std::string templ = (std::filesystem::temp_directory_path() / "sshprov-test-XXXXXX").string();
	if(!::mkdtemp(templ.data())) {
		throw std::runtime_error("mkdtemp failed for " + templ);
	}
	path_ = templ;
}

temp_dir::~temp_dir() {
	std::error_code ec;
	// a test may have removed permissions
	std::filesystem::permissions(path_, std::filesystem::perms::owner_all, ec);
	std::filesystem::remove_all(path_, ec);
}

void write_text(std::filesystem::path const& file, std::string_view text) {
	std::ofstream out(file, std::ios::binary | std::ios::trunc);
	out << text;
	if(!out) {
		throw std::runtime_error("failed to write " + file.string());
	}
}

std::string read_text(std::filesystem::path const& file) {
	std::ifstream in(file, std::ios::binary);
	std::ostringstream s;
	s << in.rdbuf();
	return s.str();
}

std::filesystem::path write_script(std::filesystem::path const& file, std::string_view body) {
	write_text(file, "#!/bin/sh\n" + std::string(body) + "\n");
	std::filesystem::permissions(file, std::filesystem::perms::owner_all
		| std::filesystem::perms::group_read | std::filesystem::perms::group_exec
		| std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
	return file;
}

std::filesystem::perms permissions(std::filesystem::path const& file) {
	return std::filesystem::status(file).permissions() & std::filesystem::perms::mask;
}

}
