#ifndef SSHPROV_COMMON_ERRORS_HEADER
#define SSHPROV_COMMON_ERRORS_HEADER

#include <string>
#include <string_view>

namespace sshprov {

enum class error_kind {
	none = 0,
	secret_unavailable,       // provider failed or the secret is empty
	filesystem_error,         // directory/file create, read, write or chmod failed
	utility_invocation_error, // external utility could not be launched or exited non-zero
	malformed_utility_output, // utility output could not be interpreted
	host_key_mismatch         // scanned host keys did not match the pinned fingerprints
};

std::string_view to_string(error_kind);

// the external OpenSSH utilities that are invoked
enum class utility {
	none = 0,
	keyscan,
	keygen,
	agent,
	add
};

std::string_view to_string(utility);

struct step_result {
	error_kind kind{error_kind::none};
	utility tool{utility::none};
	std::string message;

	bool ok() const { return kind == error_kind::none; }
	explicit operator bool() const { return ok(); }
};

inline step_result step_ok() {
	return {};
}

inline step_result step_failed(error_kind kind, std::string message, utility tool = utility::none) {
	return step_result{kind, tool, std::move(message)};
}

}

#endif
