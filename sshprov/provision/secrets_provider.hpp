#ifndef SSHPROV_PROVISION_SECRETS_PROVIDER_HEADER
#define SSHPROV_PROVISION_SECRETS_PROVIDER_HEADER

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sshprov {

struct secret_error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

/** \brief Key-value store of named credentials
 *
 *  get returns nullopt when there is no secret with the name, and throws (usually secret_error)
 *  when the store itself fails.
 */
class secrets_provider {
public:
	virtual ~secrets_provider() = default;

	virtual std::optional<std::string> get(std::string_view name) = 0;

	/// human readable description used in diagnostics
	virtual std::string describe() const = 0;
};

/// secret name is the environment variable name
class environment_secrets_provider : public secrets_provider {
public:
	std::optional<std::string> get(std::string_view name) override;
	std::string describe() const override;
};

/// every secret is a file in the directory (as in /run/secrets)
class directory_secrets_provider : public secrets_provider {
public:
	explicit directory_secrets_provider(std::filesystem::path dir);

	std::optional<std::string> get(std::string_view name) override;
	std::string describe() const override;

private:
	std::filesystem::path dir_;
};

}

#endif
