#include "crypto_context.hpp"

namespace sshprov::nettle {

std::unique_ptr<sshprov::mac> create_mac(mac_type, const_span secret, crypto_call_context const&);
std::unique_ptr<sshprov::hash> create_hash(hash_type, crypto_call_context const&);

crypto_context create_nettle_context() {
	return crypto_context{
			create_mac,
			create_hash
		};
}

}
