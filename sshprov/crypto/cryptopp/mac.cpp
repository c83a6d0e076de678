#include "sshprov/crypto/crypto_call_context.hpp"
#include "sshprov/crypto/ids.hpp"
#include "sshprov/crypto/mac.hpp"
#include <memory>

#include <cryptopp/hmac.h>
#include <cryptopp/sha.h>

namespace sshprov::cryptopp {

template<typename Hash>
class cryptopp_hmac : public mac {
public:
	using hmac = CryptoPP::HMAC<Hash>;

	cryptopp_hmac(const_span secret)
	: mac(hmac::DIGESTSIZE)
	, mac_(to_uint8_ptr(secret), secret.size())
	{
	}

	/// feed data to calculate message authentication code
	void process(const_span in) override {
		mac_.Update(to_uint8_ptr(in), in.size());
	}

	/// output mac and reset the mac accumulation
	void result(span out) override {
		SSHPROV_ASSERT(out.size() >= hmac::DIGESTSIZE, "invalid out buffer size");
		mac_.Final(to_uint8_ptr(out));
	}

private:
	hmac mac_;
};

std::unique_ptr<sshprov::mac> create_mac(mac_type type, const_span secret, crypto_call_context const& call) {
	try {
		if(type == mac_type::hmac_sha1) {
			return std::make_unique<cryptopp_hmac<CryptoPP::SHA1>>(secret);
		}
	} catch(CryptoPP::Exception const& ex) {
		call.log.log(logger::error, "cryptopp exception: {}", ex.what());
	}
	return nullptr;
}

}
