#ifndef SSHPROV_TEST_UTIL_HEADER
#define SSHPROV_TEST_UTIL_HEADER

#include <filesystem>
#include <string>
#include <string_view>

namespace sshprov::test {

/// unique directory under the system temp directory, removed with everything in it on destruction
class temp_dir {
public:
	temp_dir();
	~temp_dir();

	temp_dir(temp_dir const&) = delete;
	temp_dir& operator=(temp_dir const&) = delete;

	std::filesystem::path const& path() const { return path_; }
	std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
	std::filesystem::path path_;
};

void write_text(std::filesystem::path const& file, std::string_view text);
std::string read_text(std::filesystem::path const& file);

/// "#!/bin/sh" script with body, made executable
std::filesystem::path write_script(std::filesystem::path const& file, std::string_view body);

std::filesystem::perms permissions(std::filesystem::path const& file);

}

#endif
