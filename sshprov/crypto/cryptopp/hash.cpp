#include "sshprov/crypto/crypto_call_context.hpp"
#include "sshprov/crypto/ids.hpp"
#include "sshprov/crypto/hash.hpp"
#include <memory>

#include <cryptopp/sha.h>

namespace sshprov::cryptopp {

class sha2_256_hash : public hash {
public:
	sha2_256_hash()
	: hash(CryptoPP::SHA256::DIGESTSIZE)
	{
	}

	void process(const_span in) override {
		hash_.Update(to_uint8_ptr(in), in.size());
	}

	void digest(span out) override {
		SSHPROV_ASSERT(out.size() >= CryptoPP::SHA256::DIGESTSIZE, "invalid out buffer size");
		hash_.Final(to_uint8_ptr(out));
	}

private:
	CryptoPP::SHA256 hash_;
};

std::unique_ptr<sshprov::hash> create_hash(hash_type t, crypto_call_context const& call) {
	try {
		if(t == hash_type::sha2_256) {
			return std::make_unique<sha2_256_hash>();
		}
	} catch(CryptoPP::Exception const& ex) {
		call.log.log(logger::error, "cryptopp exception: {}", ex.what());
	}
	return nullptr;
}

}
