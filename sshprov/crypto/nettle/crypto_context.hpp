#ifndef SSHPROV_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER
#define SSHPROV_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER

#include "sshprov/crypto/crypto_context.hpp"

namespace sshprov::nettle {

crypto_context create_nettle_context();

}

#endif
