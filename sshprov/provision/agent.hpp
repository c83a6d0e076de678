#ifndef SSHPROV_PROVISION_AGENT_HEADER
#define SSHPROV_PROVISION_AGENT_HEADER

#include "sshprov/common/logger.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sshprov {

std::string_view const auth_sock_variable = "SSH_AUTH_SOCK";
std::string_view const agent_pid_variable = "SSH_AGENT_PID";

/** \brief Environment that identifies a running ssh-agent
 *
 *  Passed explicitly to the processes that need the agent, the process environment is not modified.
 */
struct agent_session {
	std::map<std::string, std::string> variables;

	/// SSH_AUTH_SOCK or empty
	std::string socket() const;

	/// SSH_AGENT_PID or empty
	std::string pid() const;

	bool valid() const { return !socket().empty(); }

	/// "NAME=value; export NAME;" lines for sh compatible shells
	std::string shell_exports() const;
};

/** \brief Parse "ssh-agent -s" output
 *
 *  For each line containing both '=' and ';' the part before the first ';' is split on the first '='.
 *  Other lines are ignored.
 */
agent_session parse_agent_output(std::string_view output, logger&);

/// agent named by SSH_AUTH_SOCK of this process if it points to a socket
std::optional<agent_session> agent_from_environment(logger&);

}

#endif
