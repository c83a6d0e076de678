#include "secure_fs.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sshprov {

namespace {

struct unique_fd {
	explicit unique_fd(int f) : fd(f) {}
	~unique_fd() {
		if(fd >= 0) {
			::close(fd);
		}
	}

	unique_fd(unique_fd const&) = delete;
	unique_fd& operator=(unique_fd const&) = delete;

	// returns errno of the failing close, 0 on success
	int close() {
		int res = 0;
		if(fd >= 0 && ::close(fd) != 0) {
			res = errno;
		}
		fd = -1;
		return res;
	}

	int fd;
};

std::string errno_message(int e) {
	return std::error_code(e, std::generic_category()).message();
}

bool write_all(int fd, std::string_view data) {
	while(!data.empty()) {
		ssize_t n = ::write(fd, data.data(), data.size());
		if(n < 0) {
			if(errno == EINTR) {
				continue;
			}
			return false;
		}
		data.remove_prefix(std::size_t(n));
	}
	return true;
}

step_result fs_failure(logger& log, std::string message) {
	log.log(logger::error, "{}", message);
	return step_failed(error_kind::filesystem_error, std::move(message));
}

}

step_result ensure_secure_directory(std::filesystem::path const& dir, logger& log) {
	std::error_code ec;
	auto st = std::filesystem::status(dir, ec);
	if(std::filesystem::exists(st)) {
		if(!std::filesystem::is_directory(st)) {
			return fs_failure(log, "'" + dir.string() + "' exists but is not a directory");
		}
		log.log(logger::debug, "directory '{}' already exists", dir.string());
		return step_ok();
	}

	std::filesystem::create_directories(dir, ec);
	if(ec) {
		return fs_failure(log, "failed to create directory '" + dir.string() + "': " + ec.message());
	}

	std::filesystem::permissions(dir, owner_only_dir_perms, std::filesystem::perm_options::replace, ec);
	if(ec) {
		return fs_failure(log, "failed to set permissions of '" + dir.string() + "': " + ec.message());
	}

	log.log(logger::debug, "created directory '{}'", dir.string());
	return step_ok();
}

step_result write_private_key(std::filesystem::path const& file, key_material const& key, logger& log) {
	unique_fd f(::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR));
	if(f.fd < 0) {
		int e = errno;
		return fs_failure(log, "failed to open '" + file.string() + "' for writing: " + errno_message(e));
	}

	// the file may have existed with wider permissions
	if(::fchmod(f.fd, S_IRUSR | S_IWUSR) != 0) {
		int e = errno;
		return fs_failure(log, "failed to set permissions of '" + file.string() + "': " + errno_message(e));
	}

	if(!write_all(f.fd, key.text())) {
		int e = errno;
		return fs_failure(log, "failed to write '" + file.string() + "': " + errno_message(e));
	}

	if(int e = f.close()) {
		return fs_failure(log, "failed to close '" + file.string() + "': " + errno_message(e));
	}

	log.log(logger::debug, "wrote private key to '{}'", file.string());
	return step_ok();
}

step_result read_or_create_text_file(std::filesystem::path const& file, std::string& content, logger& log) {
	unique_fd f(::open(file.c_str(), O_RDONLY | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR));
	if(f.fd < 0) {
		int e = errno;
		return fs_failure(log, "failed to open '" + file.string() + "': " + errno_message(e));
	}

	content.clear();
	char buf[4096];
	for(;;) {
		ssize_t n = ::read(f.fd, buf, sizeof(buf));
		if(n < 0) {
			if(errno == EINTR) {
				continue;
			}
			int e = errno;
			return fs_failure(log, "failed to read '" + file.string() + "': " + errno_message(e));
		}
		if(n == 0) {
			break;
		}
		content.append(buf, std::size_t(n));
	}
	return step_ok();
}

step_result append_text_file(std::filesystem::path const& file, std::string_view text, logger& log) {
	unique_fd f(::open(file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, S_IRUSR | S_IWUSR));
	if(f.fd < 0) {
		int e = errno;
		return fs_failure(log, "failed to open '" + file.string() + "' for appending: " + errno_message(e));
	}

	if(!write_all(f.fd, text)) {
		int e = errno;
		return fs_failure(log, "failed to append to '" + file.string() + "': " + errno_message(e));
	}

	if(int e = f.close()) {
		return fs_failure(log, "failed to close '" + file.string() + "': " + errno_message(e));
	}
	return step_ok();
}

bool remove_file(std::filesystem::path const& file, logger& log) {
	std::error_code ec;
	std::filesystem::remove(file, ec);
	if(ec) {
		log.log(logger::error, "failed to remove '{}': {}", file.string(), ec.message());
		return false;
	}
	return true;
}

}
