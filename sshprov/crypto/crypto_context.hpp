#ifndef SSHPROV_CRYPTO_CRYPTO_CONTEXT_HEADER
#define SSHPROV_CRYPTO_CRYPTO_CONTEXT_HEADER

#include "ids.hpp"
#include "crypto_call_context.hpp"
#include "hash.hpp"
#include "mac.hpp"

#include <functional>
#include <memory>

namespace sshprov {

template<typename Impl, typename... ExtraParams>
using ctor = std::function<std::unique_ptr<Impl> (ExtraParams const&..., crypto_call_context const&)>;

/// Context that is used to construct all crypto objects
struct crypto_context {
	/// construct mac from type and secret key
	ctor<mac, mac_type, const_span> construct_mac{};
	/// construct hash algorithm
	ctor<hash, hash_type> construct_hash{};
};

crypto_context default_crypto_context();

/// OpenSSH style fingerprint of a public key blob: "SHA256:" followed by unpadded base64, empty on failure
std::string sha256_fingerprint(const_span key_blob, crypto_context const&, crypto_call_context const&);

}

#endif
