#include "provision_commands.hpp"

namespace sshprov {

provision_commands::provision_commands()
: command_parser(false)
{
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(config_file, "config", "c", "file with more options, one or more per line");
	add(print_env, "print-env", "", "print agent environment as shell commands to stdout, log goes to stderr");

	add(secret, "secret", "s", "name of the secret holding the private key");
	add(secrets_dir, "secrets-dir", "", "read secrets from files in this directory instead of environment variables");
	add(ssh_dir, "ssh-dir", "", "ssh directory (default $HOME/.ssh)");
	add(key_file, "key-file", "", "file name of the private key in the ssh directory (default the secret name)");
	add(host, "host", "h", "host alias for the ssh config");
	add(host_name, "host-name", "", "real host name (default same as host)");
	add(user, "user", "u", "login user for the ssh config");
	add(fingerprints, "fingerprint", "f", "expected SHA256 fingerprint of the host key, can be given multiple times");
	add(timeout, "timeout", "t", "seconds to wait for each ssh utility, 0 waits forever");
	add(reuse_agent, "reuse-agent", "", "add the key to the agent in SSH_AUTH_SOCK if there is one");
	add(remove_key_on_failure, "remove-key-on-failure", "", "delete the key file if a later step fails");

	add(ssh_keyscan, "ssh-keyscan", "", "ssh-keyscan program");
	add(ssh_keygen, "ssh-keygen", "", "ssh-keygen program");
	add(ssh_agent, "ssh-agent", "", "ssh-agent program");
	add(ssh_add, "ssh-add", "", "ssh-add program");
}

void provision_commands::parse_command_line(int argc, char* argv[]) {
	provision_commands first;
	first.parse(argc, argv);
	if(!first.help && !first.config_file.empty()) {
		parse_file(first.config_file);
	}
	parse(argc, argv);
}

logger::type provision_commands::log_level() const {
	if(very_verbose) {
		return logger::log_all;
	}
	if(verbose) {
		return logger::type(logger::log_default | logger::debug);
	}
	return logger::log_default;
}

provisioner_config provision_commands::create_config() const {
	provisioner_config c;
	c.secret_name = secret;
	if(!ssh_dir.empty()) {
		c.ssh_dir = ssh_dir;
	}
	c.key_file_name = key_file.empty() ? secret : key_file;
	c.host = host;
	c.host_name = host_name.empty() ? host : host_name;
	c.user = user;
	c.host_fingerprints = fingerprints;
	c.tools = utility_paths{ssh_keyscan, ssh_keygen, ssh_agent, ssh_add};
	c.timeout = std::chrono::seconds(timeout);
	c.reuse_agent = reuse_agent;
	c.remove_key_on_failure = remove_key_on_failure;
	return c;
}

std::unique_ptr<secrets_provider> provision_commands::create_secrets_provider() const {
	if(!secrets_dir.empty()) {
		return std::make_unique<directory_secrets_provider>(secrets_dir);
	}
	return std::make_unique<environment_secrets_provider>();
}

}
