#ifndef SSHPROV_TOOLS_SSHPROV_PROVISION_COMMANDS_HEADER
#define SSHPROV_TOOLS_SSHPROV_PROVISION_COMMANDS_HEADER

#include "tools/common/command_parser.hpp"
#include "sshprov/common/logger.hpp"
#include "sshprov/provision/provisioner.hpp"

#include <memory>

namespace sshprov {

struct provision_commands : command_parser {
	bool help{};
	bool verbose{};
	bool very_verbose{};
	bool print_env{};
	std::string config_file;

	std::string secret{"id_rsa_github"};
	std::string secrets_dir;
	std::string ssh_dir;
	std::string key_file;
	std::string host{"github.com"};
	std::string host_name;
	std::string user{"git"};
	std::vector<std::string> fingerprints;
	std::size_t timeout{};
	bool reuse_agent{};
	bool remove_key_on_failure{};

	std::string ssh_keyscan{"ssh-keyscan"};
	std::string ssh_keygen{"ssh-keygen"};
	std::string ssh_agent{"ssh-agent"};
	std::string ssh_add{"ssh-add"};

	provision_commands();

	/// options of --config file first, then the command line on top of them
	void parse_command_line(int argc, char* argv[]);

	logger::type log_level() const;
	provisioner_config create_config() const;
	std::unique_ptr<secrets_provider> create_secrets_provider() const;
};

}

#endif
