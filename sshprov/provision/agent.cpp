#include "agent.hpp"
#include "sshprov/common/util.hpp"

#include <cstdlib>

#include <sys/stat.h>

namespace sshprov {

static std::string lookup(std::map<std::string, std::string> const& vars, std::string_view name) {
	auto it = vars.find(std::string(name));
	return it != vars.end() ? it->second : std::string{};
}

std::string agent_session::socket() const {
	return lookup(variables, auth_sock_variable);
}

std::string agent_session::pid() const {
	return lookup(variables, agent_pid_variable);
}

static std::string shell_quote(std::string const& s) {
	if(!s.empty() && s.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-./:@%+,") == std::string::npos) {
		return s;
	}
	std::string res = "'";
	for(char c : s) {
		if(c == '\'') {
			res += "'\\''";
		} else {
			res += c;
		}
	}
	return res + "'";
}

std::string agent_session::shell_exports() const {
	std::string res;
	for(auto&& [name, value] : variables) {
		res += name + "=" + shell_quote(value) + "; export " + name + ";\n";
	}
	return res;
}

agent_session parse_agent_output(std::string_view output, logger& log) {
	agent_session res;
	for(auto line : split_lines(output)) {
		if(line.find('=') == std::string_view::npos || line.find(';') == std::string_view::npos) {
			if(!trim(line).empty()) {
				log.log(logger::debug_verbose, "ignoring agent output line: {}", line);
			}
			continue;
		}

		auto assignment = line.substr(0, line.find(';'));
		auto eq = assignment.find('=');
		if(eq == std::string_view::npos || eq == 0) {
			log.log(logger::debug_verbose, "ignoring agent output line: {}", line);
			continue;
		}

		res.variables[std::string(assignment.substr(0, eq))] = std::string(assignment.substr(eq + 1));
	}
	return res;
}

std::optional<agent_session> agent_from_environment(logger& log) {
	char const* sock = std::getenv(std::string(auth_sock_variable).c_str());
	if(!sock || !*sock) {
		return std::nullopt;
	}

	struct stat st{};
	if(::stat(sock, &st) != 0 || !S_ISSOCK(st.st_mode)) {
		log.log(logger::debug, "{}={} does not name a socket", auth_sock_variable, sock);
		return std::nullopt;
	}

	agent_session res;
	res.variables[std::string(auth_sock_variable)] = sock;
	if(char const* pid = std::getenv(std::string(agent_pid_variable).c_str())) {
		res.variables[std::string(agent_pid_variable)] = pid;
	}
	return res;
}

}
