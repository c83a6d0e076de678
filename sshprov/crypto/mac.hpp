#ifndef SSHPROV_CRYPTO_MAC_HEADER
#define SSHPROV_CRYPTO_MAC_HEADER

#include "sshprov/common/types.hpp"

namespace sshprov {

class mac {
public:
	mac(std::size_t size)
	: size_(size)
	{}

	virtual ~mac() = default;

	/// size of the message authentication code in bytes
	std::size_t size() const { return size_; }

	/// feed data to calculate message authentication code
	virtual void process(const_span in) = 0;

	/// output mac and reset the mac accumulation
	virtual void result(span out) = 0;

	byte_vector result() {
		byte_vector ret;
		ret.resize(size());
		result(ret);
		return ret;
	}

private:
	std::size_t const size_;
};

}

#endif
