#include "known_hosts.hpp"
#include "sshprov/common/util.hpp"

namespace sshprov {

// --------------------------------------------------------------------

static byte_vector hmac_sha1(std::string_view host, const_span salt, crypto_context const& crypto, crypto_call_context const& call) {
	auto mac = crypto.construct_mac(mac_type::hmac_sha1, salt, call);
	if(!mac) {
		call.log.log(logger::error, "{} is not supported by the crypto backend", to_string(mac_type::hmac_sha1));
		return {};
	}
	mac->process(to_span(host));
	return mac->result();
}

std::string hash_host_name(std::string_view host, const_span salt, crypto_context const& crypto, crypto_call_context const& call) {
	auto hash = hmac_sha1(host, salt, crypto, call);
	if(hash.empty()) {
		return {};
	}
	return "|1|" + encode_base64(salt, true) + "|" + encode_base64(hash, true);
}

static bool is_wildcard(std::string_view pattern) {
	return pattern.find_first_of("*?") != std::string_view::npos;
}

bool known_hosts::entry::names(std::string_view host, crypto_context const& crypto, crypto_call_context const& call) const {
	bool match = false;
	for(auto&& p : hosts) {
		std::string_view pattern = p;

		// a negated pattern that names the host excludes the whole line
		if(pattern.starts_with('!')) {
			if(iequals(pattern.substr(1), host)) {
				return false;
			}
			continue;
		}

		if(pattern.starts_with("|1|")) {
			auto sep = pattern.find('|', 3);
			if(sep == std::string_view::npos) {
				continue;
			}
			auto salt = decode_base64(pattern.substr(3, sep - 3));
			auto hash = decode_base64(pattern.substr(sep + 1));
			if(!salt.empty() && !hash.empty() && hmac_sha1(host, salt, crypto, call) == hash) {
				match = true;
			}
		} else if(!is_wildcard(pattern) && iequals(pattern, host)) {
			match = true;
		}
	}
	return match;
}

// --------------------------------------------------------------------

known_hosts known_hosts::parse(std::string_view text, logger& log) {
	known_hosts res;

	std::size_t line_no = 0;
	for(auto line : split_lines(text)) {
		++line_no;
		line = trim(line);
		if(line.empty() || line.front() == '#') {
			continue;
		}

		auto words = split_words(line);

		entry e;
		e.line = line_no;
		std::size_t i = 0;
		if(words.front().starts_with('@')) {
			e.marker = words.front();
			++i;
		}

		if(words.size() < i + 3) {
			log.log(logger::debug, "skipping malformed known_hosts line {}", line_no);
			continue;
		}

		std::string_view hosts = words[i];
		while(!hosts.empty()) {
			auto c = hosts.find(',');
			auto h = hosts.substr(0, c);
			if(!h.empty()) {
				e.hosts.emplace_back(h);
			}
			hosts.remove_prefix(c == std::string_view::npos ? hosts.size() : c + 1);
		}

		e.key_type = words[i+1];
		e.key = words[i+2];

		// the comment is the rest of the line as is
		if(words.size() > i + 3) {
			auto start = words[i+3].data() - line.data();
			e.comment = line.substr(std::size_t(start));
		}

		if(e.hosts.empty() || decode_base64(e.key).empty()) {
			log.log(logger::debug, "skipping malformed known_hosts line {}", line_no);
			continue;
		}

		res.entries_.push_back(std::move(e));
	}

	return res;
}

bool known_hosts::has_host(std::string_view host, crypto_context const& crypto, crypto_call_context const& call) const {
	for(auto&& e : entries_) {
		if(e.marker.empty() && e.names(host, crypto, call)) {
			return true;
		}
	}
	return false;
}

std::vector<known_hosts::entry> known_hosts::find(std::string_view host, crypto_context const& crypto, crypto_call_context const& call) const {
	std::vector<entry> res;
	for(auto&& e : entries_) {
		if(e.names(host, crypto, call)) {
			res.push_back(e);
		}
	}
	return res;
}

std::string fingerprint(known_hosts::entry const& e, crypto_context const& crypto, crypto_call_context const& call) {
	return sha256_fingerprint(decode_base64(e.key), crypto, call);
}

}
