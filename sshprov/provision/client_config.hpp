#ifndef SSHPROV_PROVISION_CLIENT_CONFIG_HEADER
#define SSHPROV_PROVISION_CLIENT_CONFIG_HEADER

#include "sshprov/common/logger.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sshprov {

struct config_directive {
	std::string keyword;
	std::string value;
};

/** \brief Block of directives scoped to host patterns ("Host ..." or "Match ...")
 */
struct config_stanza {
	enum kind_type { global, host, match };

	kind_type kind{global};
	std::vector<std::string> patterns;
	std::vector<config_directive> directives;
	std::size_t line{};

	/// value of the first directive with the keyword (case-insensitive)
	std::optional<std::string> get(std::string_view keyword) const;
};

/// Parsed OpenSSH client configuration (~/.ssh/config)
class client_config {
public:
	static client_config parse(std::string_view text, logger&);

	/// the first Host stanza naming the host exactly, nullptr if none (wildcards and negations do not count)
	config_stanza const* find_host(std::string_view host) const;

private:
	std::vector<config_stanza> stanzas_;
};

struct host_stanza_params {
	std::string host;
	std::string host_name;
	std::string identity_file;
	std::string user;
};

/// text to append to the config, starts with an empty line
std::string render_host_stanza(host_stanza_params const&);

/// value without surrounding double quotes
std::string_view unquote(std::string_view value);

}

#endif
