#ifndef SSHPROV_PROVISION_PROCESS_HEADER
#define SSHPROV_PROVISION_PROCESS_HEADER

#include "sshprov/common/logger.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace sshprov {

using namespace std::literals;

struct process_options {
	/// set in the child's environment on top of the inherited one
	std::map<std::string, std::string> env;

	/// kill the child if it runs longer than this (zero means wait forever)
	std::chrono::milliseconds timeout{0};
};

struct process_result {
	bool launched{};
	int exit_code{-1};
	int signal{};       // signal that terminated the child
	bool timed_out{};
	std::string out;
	std::string err;
	std::string error;  // why the process could not be run

	bool success() const { return launched && !timed_out && signal == 0 && exit_code == 0; }

	/// short human readable status like "exit status 1"
	std::string status() const;
};

/** \brief Run program (searched in PATH) without a shell and wait for it to exit
 *
 *  stdout and stderr are captured separately, stdin is inherited. Never throws for a failing child.
 */
process_result run_process(std::vector<std::string> const& argv, process_options const&, logger&);

/// argv joined with spaces for diagnostics
std::string command_line(std::vector<std::string> const& argv);

}

#endif
