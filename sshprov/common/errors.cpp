#include "errors.hpp"

namespace sshprov {

std::string_view to_string(error_kind k) {
	using enum error_kind;
	if(k == none) return "none";
	if(k == secret_unavailable) return "secret unavailable";
	if(k == filesystem_error) return "filesystem error";
	if(k == utility_invocation_error) return "utility invocation error";
	if(k == malformed_utility_output) return "malformed utility output";
	if(k == host_key_mismatch) return "host key mismatch";
	return "unknown";
}

std::string_view to_string(utility u) {
	using enum utility;
	if(u == keyscan) return "ssh-keyscan";
	if(u == keygen) return "ssh-keygen";
	if(u == agent) return "ssh-agent";
	if(u == add) return "ssh-add";
	return "none";
}

}
