#include "ids.hpp"

namespace sshprov {

std::string_view to_string(mac_type t) {
	using enum mac_type;
	if(t == hmac_sha1) return "hmac-sha1";
	return "unknown";
}

std::string_view to_string(hash_type t) {
	using enum hash_type;
	if(t == sha2_256) return "sha2-256";
	return "unknown";
}

}
