#include "provisioner.hpp"
#include "client_config.hpp"
#include "known_hosts.hpp"
#include "secure_fs.hpp"
#include "sshprov/common/util.hpp"

#include <algorithm>
#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

namespace sshprov {

std::filesystem::path default_ssh_dir() {
	if(char const* home = std::getenv("HOME"); home && *home) {
		return std::filesystem::path(home) / ".ssh";
	}
	if(passwd const* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
		return std::filesystem::path(pw->pw_dir) / ".ssh";
	}
	return ".ssh";
}

std::string_view to_string(provision_step s) {
	using enum provision_step;
	if(s == fetch_secret) return "fetch secret";
	if(s == secure_directory) return "secure directory";
	if(s == write_key) return "write key";
	if(s == trust_host) return "trust host";
	if(s == client_config) return "client config";
	if(s == verify_key) return "verify key";
	if(s == load_agent) return "load agent";
	if(s == done) return "done";
	return "unknown";
}

provisioner::provisioner(provisioner_config c, secrets_provider& secrets, logger& log, crypto_context crypto)
: config_(std::move(c))
, secrets_(secrets)
, log_(log)
, crypto_(std::move(crypto))
{
	if(config_.ssh_dir.empty()) {
		config_.ssh_dir = default_ssh_dir();
	}
}

provision_result provisioner::provision() {
	return provision(config_.secret_name);
}

bool provisioner::provision_ok(std::string_view secret_name) {
	return provision(secret_name).ok();
}

provision_result provisioner::provision(std::string_view secret_name) {
	provision_result res;
	bool key_written = false;

	auto failed = [&](provision_step step, step_result r) {
		res.step = step;
		res.error = std::move(r);
		if(key_written && config_.remove_key_on_failure) {
			log_.log(logger::info, "Removing {} after failed step '{}'", config_.key_path().string(), to_string(step));
			if(!remove_file(config_.key_path(), log_)) {
				log_.log(logger::error, "Private key is left at {}", config_.key_path().string());
			}
		}
		return res;
	};

	std::optional<key_material> key;
	if(auto r = fetch_secret(secret_name, key); !r) {
		return failed(provision_step::fetch_secret, std::move(r));
	}

	if(auto r = secure_directory(); !r) {
		return failed(provision_step::secure_directory, std::move(r));
	}

	if(auto r = write_key(*key); !r) {
		return failed(provision_step::write_key, std::move(r));
	}
	key_written = true;

	if(auto r = trust_host(); !r) {
		return failed(provision_step::trust_host, std::move(r));
	}

	if(auto r = ensure_config_stanza(); !r) {
		return failed(provision_step::client_config, std::move(r));
	}

	if(auto r = verify_key(secret_name, res.key_fingerprint); !r) {
		return failed(provision_step::verify_key, std::move(r));
	}

	agent_session session;
	if(auto r = load_into_agent(session); !r) {
		return failed(provision_step::load_agent, std::move(r));
	}
	res.agent = std::move(session);

	log_.log(logger::info, "SSH key setup complete. You can test it with 'ssh -T {}@{}'.", config_.user, config_.host);
	return res;
}

process_options provisioner::process_opts() const {
	process_options opts;
	opts.timeout = config_.timeout;
	return opts;
}

step_result provisioner::utility_failure(utility tool, process_result const& pr, std::string const& hint) {
	std::string message;
	if(!pr.launched) {
		message = pr.error;
	} else {
		message = std::string(to_string(tool)) + " failed with " + pr.status();
		auto err = trim(pr.err);
		if(!err.empty()) {
			message += ": " + std::string(err);
		}
	}

	log_.log(logger::error, "Error running {}: {}", to_string(tool), pr.launched ? pr.status() : pr.error);
	if(pr.launched) {
		log_.log(logger::error, "Stderr: {}", trim(pr.err));
	}
	if(!hint.empty()) {
		log_.log(logger::error, "{}", hint);
	}
	return step_failed(error_kind::utility_invocation_error, std::move(message), tool);
}

// --------------------------------------------------------------------

step_result provisioner::fetch_secret(std::string_view name, std::optional<key_material>& key) {
	std::optional<std::string> value;
	try {
		value = secrets_.get(name);
	} catch(std::exception const& e) {
		log_.log(logger::error, "Error retrieving '{}' from {}: {}", name, secrets_.describe(), e.what());
		log_.log(logger::error, "Please ensure you have added your SSH private key to {} with the name '{}'.", secrets_.describe(), name);
		return step_failed(error_kind::secret_unavailable, "failed to retrieve secret '" + std::string(name) + "': " + e.what());
	}

	if(value) {
		key = key_material::from_secret(*value);
	}

	if(!key) {
		log_.log(logger::error, "Error: '{}' secret is empty or not found.", name);
		log_.log(logger::error, "Please ensure you have added your SSH private key to {} with the name '{}'.", secrets_.describe(), name);
		return step_failed(error_kind::secret_unavailable, "secret '" + std::string(name) + "' is empty or not found");
	}

	log_.log(logger::debug, "Secret '{}' has {} lines, starting with '{}'", name, key->lines().size(), key->header());
	return step_ok();
}

step_result provisioner::secure_directory() {
	return ensure_secure_directory(config_.ssh_dir, log_);
}

step_result provisioner::write_key(key_material const& key) {
	return write_private_key(config_.key_path(), key, log_);
}

step_result provisioner::trust_host() {
	auto const path = config_.known_hosts_path();

	std::string content;
	if(auto r = read_or_create_text_file(path, content, log_); !r) {
		log_.log(logger::error, "Error managing known_hosts.");
		return r;
	}

	crypto_call_context call{log_};
	auto known = known_hosts::parse(content, log_);
	if(known.has_host(config_.host_name, crypto_, call)) {
		log_.log(logger::info, "{} already in known_hosts.", config_.host_name);
		for(auto&& e : known.find(config_.host_name, crypto_, call)) {
			log_.log(logger::info, "  {}{}{} {} (line {})", e.marker, e.marker.empty() ? "" : " ", e.key_type, fingerprint(e, crypto_, call), e.line);
		}
		return step_ok();
	}

	log_.log(logger::info, "Adding {} to known_hosts...", config_.host_name);

	session_logger slog(log_, "[" + std::string(to_string(utility::keyscan)) + "] ");
	auto pr = run_process({config_.tools.keyscan, "-H", config_.host_name}, process_opts(), slog);
	if(!pr.success()) {
		return utility_failure(utility::keyscan, pr);
	}
	if(!trim(pr.err).empty()) {
		slog.log(logger::debug, "{}", trim(pr.err));
	}

	auto scanned = known_hosts::parse(pr.out, slog);
	if(scanned.empty()) {
		log_.log(logger::error, "{} returned no host keys for {}", to_string(utility::keyscan), config_.host_name);
		return step_failed(error_kind::utility_invocation_error, "no host keys for " + config_.host_name, utility::keyscan);
	}

	bool pinned_match = config_.host_fingerprints.empty();
	for(auto&& e : scanned) {
		auto fp = fingerprint(e, crypto_, call);
		log_.log(logger::info, "  {} {}", e.key_type, fp);
		if(std::find(config_.host_fingerprints.begin(), config_.host_fingerprints.end(), fp) != config_.host_fingerprints.end()) {
			pinned_match = true;
		}
	}

	if(!pinned_match) {
		log_.log(logger::error, "None of the host keys of {} has an expected fingerprint, known_hosts not changed", config_.host_name);
		return step_failed(error_kind::host_key_mismatch, "unexpected host keys for " + config_.host_name, utility::keyscan);
	}

	auto lines = split_lines(pr.out);
	std::string text;
	if(!content.empty() && content.back() != '\n') {
		text += '\n';
	}
	for(auto&& e : scanned) {
		text += trim(lines[e.line - 1]);
		text += '\n';
	}

	if(auto r = append_text_file(path, text, log_); !r) {
		log_.log(logger::error, "Error managing known_hosts.");
		return r;
	}
	return step_ok();
}

step_result provisioner::ensure_config_stanza() {
	auto const path = config_.config_path();

	std::string content;
	if(auto r = read_or_create_text_file(path, content, log_); !r) {
		log_.log(logger::error, "Error managing SSH config.");
		return r;
	}

	auto cfg = client_config::parse(content, log_);
	if(auto stanza = cfg.find_host(config_.host)) {
		log_.log(logger::info, "SSH configuration for {} already exists in {}.", config_.host, path.string());

		// existing stanza is kept as is even if it uses another key
		auto identity = stanza->get("IdentityFile");
		auto const key_path = config_.key_path().string();
		if(!identity) {
			log_.log(logger::info, "Host {} on line {} has no IdentityFile, {} is not used for it", config_.host, stanza->line, key_path);
		} else if(unquote(*identity) != key_path) {
			log_.log(logger::info, "Host {} on line {} uses IdentityFile {}, not {}", config_.host, stanza->line, *identity, key_path);
		}
		return step_ok();
	}

	std::string text = render_host_stanza({config_.host, config_.host_name, config_.key_path().string(), config_.user});
	if(auto r = append_text_file(path, text, log_); !r) {
		log_.log(logger::error, "Error managing SSH config.");
		return r;
	}

	log_.log(logger::debug, "Added Host {} to {}", config_.host, path.string());
	return step_ok();
}

step_result provisioner::verify_key(std::string_view secret_name, std::string& fp) {
	auto const key_path = config_.key_path().string();
	log_.log(logger::info, "Verifying SSH key at {}...", key_path);

	session_logger slog(log_, "[" + std::string(to_string(utility::keygen)) + "] ");
	auto pr = run_process({config_.tools.keygen, "-l", "-f", key_path}, process_opts(), slog);
	if(!pr.success()) {
		return utility_failure(utility::keygen, pr,
			"This might indicate an issue with the key's format or content. Please check your '" + std::string(secret_name) + "' secret.");
	}

	fp = std::string(trim(pr.out));
	log_.log(logger::info, "SSH key fingerprint:");
	log_.log(logger::info, "{}", fp);
	return step_ok();
}

step_result provisioner::load_into_agent(agent_session& session) {
	log_.log(logger::info, "Attempting to start ssh-agent and add SSH key...");

	std::optional<agent_session> existing;
	if(config_.reuse_agent) {
		existing = agent_from_environment(log_);
	}

	if(existing) {
		session = std::move(*existing);
		log_.log(logger::info, "Using running SSH agent at {}.", session.socket());
	} else {
		session_logger slog(log_, "[" + std::string(to_string(utility::agent)) + "] ");
		auto pr = run_process({config_.tools.agent, "-s"}, process_opts(), slog);
		if(!pr.success()) {
			return utility_failure(utility::agent, pr);
		}

		session = parse_agent_output(pr.out, slog);
		if(!session.valid()) {
			log_.log(logger::error, "{} output did not contain {}", to_string(utility::agent), auth_sock_variable);
			return step_failed(error_kind::malformed_utility_output,
				std::string(to_string(utility::agent)) + " output did not contain " + std::string(auth_sock_variable), utility::agent);
		}
		log_.log(logger::info, "SSH agent started and environment variables set.");
		log_.log(logger::debug, "{}={} {}={}", auth_sock_variable, session.socket(), agent_pid_variable, session.pid());
	}

	auto opts = process_opts();
	opts.env = session.variables;

	session_logger slog(log_, "[" + std::string(to_string(utility::add)) + "] ");
	auto pr = run_process({config_.tools.add, config_.key_path().string()}, opts, slog);
	if(!pr.success()) {
		return utility_failure(utility::add, pr);
	}

	log_.log(logger::info, "ssh-add stdout: {}", trim(pr.out));
	if(!pr.err.empty()) {
		log_.log(logger::info, "ssh-add stderr: {}", trim(pr.err));
	}
	log_.log(logger::info, "SSH key added to agent successfully.");
	return step_ok();
}

}
