#ifndef SSHPROV_PROVISION_KNOWN_HOSTS_HEADER
#define SSHPROV_PROVISION_KNOWN_HOSTS_HEADER

#include "sshprov/crypto/crypto_context.hpp"

#include <string>
#include <string_view>
#include <vector>

/// \file known_hosts.hpp
/// Parsed OpenSSH known_hosts file, used to decide whether a host is already trusted.

namespace sshprov {

class known_hosts {
public:
	struct entry {
		std::string marker;               ///< "@cert-authority", "@revoked" or empty
		std::vector<std::string> hosts;   ///< host patterns, plain or hashed ("|1|salt|hash")
		std::string key_type;
		std::string key;                  ///< base64 encoded public key blob
		std::string comment;
		std::size_t line{};               ///< 1-based line number in the source text

		/// exact match of host name against one of the patterns, negated and wildcard patterns never match
		bool names(std::string_view host, crypto_context const&, crypto_call_context const&) const;
	};

	/// Parse text in known_hosts format, comments, blank and malformed lines are skipped
	static known_hosts parse(std::string_view text, logger&);

	/// true if there is a plain (unmarked) key entry for the host
	bool has_host(std::string_view host, crypto_context const&, crypto_call_context const&) const;

	/// all entries naming the host
	std::vector<entry> find(std::string_view host, crypto_context const&, crypto_call_context const&) const;

	using iterator = std::vector<entry>::const_iterator;

	iterator begin() const { return entries_.cbegin(); }
	iterator end() const { return entries_.cend(); }
	bool empty() const { return entries_.empty(); }
	std::size_t size() const { return entries_.size(); }

private:
	std::vector<entry> entries_;
};

/// hashed host name as written by "ssh-keygen -H" / "ssh-keyscan -H", empty if mac is not available
std::string hash_host_name(std::string_view host, const_span salt, crypto_context const&, crypto_call_context const&);

/// SHA256 fingerprint of entry's key, empty if the key is not valid base64
std::string fingerprint(known_hosts::entry const&, crypto_context const&, crypto_call_context const&);

}

#endif
