#ifndef SSHPROV_CRYPTO_IDS_HEADER
#define SSHPROV_CRYPTO_IDS_HEADER

#include <string_view>

namespace sshprov {

enum class mac_type {
	unknown = 0,
	hmac_sha1         // hashed host names in known_hosts
};

std::string_view to_string(mac_type);

enum class hash_type {
	unknown = 0,
	sha2_256          // key fingerprints
};

std::string_view to_string(hash_type);

}

#endif
