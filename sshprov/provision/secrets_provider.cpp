#include "secrets_provider.hpp"
#include "sshprov/common/util.hpp"

#include <cstdlib>

namespace sshprov {

std::optional<std::string> environment_secrets_provider::get(std::string_view name) {
	if(name.empty() || name.find('=') != std::string_view::npos) {
		throw secret_error("invalid environment variable name '" + std::string(name) + "'");
	}
	char const* v = std::getenv(std::string(name).c_str());
	if(!v) {
		return std::nullopt;
	}
	return std::string(v);
}

std::string environment_secrets_provider::describe() const {
	return "environment variables";
}

directory_secrets_provider::directory_secrets_provider(std::filesystem::path dir)
: dir_(std::move(dir))
{
}

std::optional<std::string> directory_secrets_provider::get(std::string_view name) {
	if(name.empty() || name.find('/') != std::string_view::npos || name == "." || name == "..") {
		throw secret_error("invalid secret name '" + std::string(name) + "'");
	}

	auto file = dir_ / name;
	std::error_code ec;
	if(!std::filesystem::exists(file, ec)) {
		if(ec) {
			throw secret_error("cannot access '" + file.string() + "': " + ec.message());
		}
		return std::nullopt;
	}

	auto content = read_file(file);
	if(!content) {
		throw secret_error("cannot read '" + file.string() + "'");
	}
	return content;
}

std::string directory_secrets_provider::describe() const {
	return "secrets directory '" + dir_.string() + "'";
}

}
