#include "sshprov/crypto/crypto_call_context.hpp"
#include "sshprov/crypto/ids.hpp"
#include "sshprov/crypto/mac.hpp"
#include <algorithm>
#include <memory>

#include <nettle/hmac.h>

namespace sshprov::nettle {

class hmac_sha1 : public mac {
public:
	hmac_sha1(const_span secret)
	: mac(SHA1_DIGEST_SIZE)
	{
		nettle_hmac_sha1_set_key(&ctx_, secret.size(), to_uint8_ptr(secret));
	}

	void process(const_span in) override {
		nettle_hmac_sha1_update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void result(span out) override {
		std::size_t size = std::min<std::size_t>(SHA1_DIGEST_SIZE, out.size());
		nettle_hmac_sha1_digest(&ctx_, size, to_uint8_ptr(out));
	}

private:
	hmac_sha1_ctx ctx_;
};

std::unique_ptr<sshprov::mac> create_mac(mac_type type, const_span secret, crypto_call_context const&) {
	if(type == mac_type::hmac_sha1) {
		return std::make_unique<hmac_sha1>(secret);
	}
	return nullptr;
}

}
