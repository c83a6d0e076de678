#ifndef SSHPROV_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER
#define SSHPROV_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER

#include "sshprov/common/logger.hpp"

namespace sshprov {

/// Context that is passed to crypto construct functions
struct crypto_call_context {
	logger& log;
};

}

#endif
