#include "crypto_context.hpp"

#include "config.hpp"
#include "sshprov/common/util.hpp"

#ifdef USE_NETTLE
#	include "sshprov/crypto/nettle/crypto_context.hpp"
#elif defined(USE_CRYPTOPP)
#	include "sshprov/crypto/cryptopp/crypto_context.hpp"
#endif

namespace sshprov {

crypto_context default_crypto_context() {
#ifdef USE_NETTLE
	return nettle::create_nettle_context();
#elif defined(USE_CRYPTOPP)
	return cryptopp::create_cryptopp_context();
#else
#	error No default crypto context set
#endif
}

std::string sha256_fingerprint(const_span key_blob, crypto_context const& crypto, crypto_call_context const& call) {
	std::string res;
	if(!key_blob.empty()) {
		auto sha256 = crypto.construct_hash(hash_type::sha2_256, call);
		if(sha256) {
			sha256->process(key_blob);
			res = "SHA256:" + encode_base64(sha256->digest());
		} else {
			call.log.log(logger::error, "{} is not supported by the crypto backend", to_string(hash_type::sha2_256));
		}
	}
	return res;
}

}
