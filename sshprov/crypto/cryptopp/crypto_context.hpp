#ifndef SSHPROV_CRYPTO_CRYPTOPP_CRYPTO_CONTEXT_HEADER
#define SSHPROV_CRYPTO_CRYPTOPP_CRYPTO_CONTEXT_HEADER

#include "sshprov/crypto/crypto_context.hpp"

namespace sshprov::cryptopp {

crypto_context create_cryptopp_context();

}

#endif
