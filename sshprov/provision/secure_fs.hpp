#ifndef SSHPROV_PROVISION_SECURE_FS_HEADER
#define SSHPROV_PROVISION_SECURE_FS_HEADER

#include "key_material.hpp"
#include "sshprov/common/errors.hpp"
#include "sshprov/common/logger.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sshprov {

std::filesystem::perms const owner_only_dir_perms = std::filesystem::perms::owner_all;
std::filesystem::perms const owner_only_file_perms = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

/// create directory and parents with owner only access, an existing directory is left as is
step_result ensure_secure_directory(std::filesystem::path const& dir, logger&);

/// write key text (truncating) and restrict the file to owner read/write
step_result write_private_key(std::filesystem::path const& file, key_material const& key, logger&);

/// read text file, creating it empty (owner read/write) if it does not exist
step_result read_or_create_text_file(std::filesystem::path const& file, std::string& content, logger&);

/// append text to file, creating it if needed
step_result append_text_file(std::filesystem::path const& file, std::string_view text, logger&);

/// remove file if it exists, returns false if it existed and could not be removed
bool remove_file(std::filesystem::path const& file, logger&);

}

#endif
