#include "sshprov/crypto/crypto_call_context.hpp"
#include "sshprov/crypto/ids.hpp"
#include "sshprov/crypto/hash.hpp"
#include <algorithm>
#include <memory>

#include <nettle/sha2.h>

namespace sshprov::nettle {

class sha2_256_hash : public hash {
public:
	sha2_256_hash()
	: hash(SHA256_DIGEST_SIZE)
	{
		nettle_sha256_init(&ctx_);
	}

	void process(const_span in) override {
		nettle_sha256_update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void digest(span out) override {
		SSHPROV_ASSERT(out.size() >= SHA256_DIGEST_SIZE, "invalid out buffer size");
		std::size_t size = std::min<std::size_t>(SHA256_DIGEST_SIZE, out.size());
		nettle_sha256_digest(&ctx_, size, to_uint8_ptr(out));
	}

private:
	sha256_ctx ctx_;
};

std::unique_ptr<sshprov::hash> create_hash(hash_type t, crypto_call_context const&) {
	if(t == hash_type::sha2_256) {
		return std::make_unique<sha2_256_hash>();
	}
	return nullptr;
}

}
