#ifndef SSHPROV_PROVISION_PROVISIONER_HEADER
#define SSHPROV_PROVISION_PROVISIONER_HEADER

#include "agent.hpp"
#include "key_material.hpp"
#include "process.hpp"
#include "secrets_provider.hpp"
#include "sshprov/common/errors.hpp"
#include "sshprov/common/logger.hpp"
#include "sshprov/crypto/crypto_context.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sshprov {

/// program names or paths of the OpenSSH utilities
struct utility_paths {
	std::string keyscan{"ssh-keyscan"};
	std::string keygen{"ssh-keygen"};
	std::string agent{"ssh-agent"};
	std::string add{"ssh-add"};
};

/** \brief Settings for provisioning
 */
struct provisioner_config {
	/// name of the secret holding the private key
	std::string secret_name{"id_rsa_github"};

	/// directory that receives the key, known_hosts and config
	std::filesystem::path ssh_dir;

	/// file name of the private key inside ssh_dir
	std::string key_file_name{"id_rsa_github"};

	/// host pattern of the config stanza
	std::string host{"github.com"};

	/// real host name, scanned and looked up in known_hosts
	std::string host_name{"github.com"};

	/// login user of the config stanza
	std::string user{"git"};

	/// if not empty, at least one scanned host key must have one of these SHA256 fingerprints
	std::vector<std::string> host_fingerprints;

	utility_paths tools;

	/// deadline for each utility, zero waits forever
	std::chrono::milliseconds timeout{0};

	/// use the agent from SSH_AUTH_SOCK if there is one instead of starting a new one
	bool reuse_agent{false};

	/// delete the written key file if a later step fails
	bool remove_key_on_failure{false};

	std::filesystem::path key_path() const { return ssh_dir / key_file_name; }
	std::filesystem::path known_hosts_path() const { return ssh_dir / "known_hosts"; }
	std::filesystem::path config_path() const { return ssh_dir / "config"; }
};

/// $HOME/.ssh, or the password database home directory if HOME is not set
std::filesystem::path default_ssh_dir();

enum class provision_step {
	fetch_secret,
	secure_directory,
	write_key,
	trust_host,
	client_config,
	verify_key,
	load_agent,
	done
};

std::string_view to_string(provision_step);

struct provision_result {
	/// kind none when everything succeeded
	step_result error;
	/// the step that failed or done
	provision_step step{provision_step::done};

	/// set once the agent step succeeded
	std::optional<agent_session> agent;
	/// output of ssh-keygen -l
	std::string key_fingerprint;

	bool ok() const { return error.ok(); }
	explicit operator bool() const { return ok(); }
};

/** \brief Sets up SSH access to one host with a key from a secrets provider
 *
 *  Steps run in order and the first failure stops the run:
 *   1. fetch and normalize the secret
 *   2. ensure the ssh directory exists with owner only access
 *   3. write the key file (owner read/write)
 *   4. add the host keys to known_hosts unless the host is already there
 *   5. add a Host stanza to config unless the host already has one
 *   6. verify the key with ssh-keygen
 *   7. start ssh-agent and add the key to it
 *
 *  Nothing throws, every failure is logged and returned.
 */
class provisioner {
public:
	provisioner(provisioner_config, secrets_provider&, logger&, crypto_context = default_crypto_context());

	/// provision with config().secret_name
	provision_result provision();
	provision_result provision(std::string_view secret_name);

	/// same as provision but only tells if it succeeded
	bool provision_ok(std::string_view secret_name);

	provisioner_config const& config() const { return config_; }

private:
	step_result fetch_secret(std::string_view name, std::optional<key_material>&);
	step_result secure_directory();
	step_result write_key(key_material const&);
	step_result trust_host();
	step_result ensure_config_stanza();
	step_result verify_key(std::string_view secret_name, std::string& fingerprint);
	step_result load_into_agent(agent_session&);

	step_result utility_failure(utility, process_result const&, std::string const& hint = {});
	process_options process_opts() const;

private:
	provisioner_config config_;
	secrets_provider& secrets_;
	logger& log_;
	crypto_context crypto_;
};

}

#endif
