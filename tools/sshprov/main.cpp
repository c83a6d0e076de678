#include "provision_commands.hpp"

#include <stdexcept>
#include <iostream>

int main(int argc, char* argv[]) {
	try {
		using namespace sshprov;
		provision_commands p;
		p.parse_command_line(argc, argv);
		if(p.help) {
			std::cout << "sshprov - set up SSH access with a key from a secret\n";
			provision_commands().print_help(std::cout);
			return 0;
		}

		stdout_logger out_log(p.log_level());
		stderr_logger err_log(p.log_level());
		logger& log = p.print_env ? static_cast<logger&>(err_log) : out_log;

		auto secrets = p.create_secrets_provider();
		provisioner prov(p.create_config(), *secrets, log);

		auto res = prov.provision();
		if(!res) {
			log.log(logger::debug, "Failed at step '{}' ({}): {}", to_string(res.step), to_string(res.error.kind), res.error.message);
			return 1;
		}

		if(p.print_env && res.agent) {
			std::cout << res.agent->shell_exports() << std::flush;
		}
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
