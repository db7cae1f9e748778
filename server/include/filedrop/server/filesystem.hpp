#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace filedrop::server
{

    inline constexpr std::size_t kMaxFilenameLength = 255;

    // Reduces a client supplied name to [A-Za-z0-9._-]. Path separators and
    // whitespace runs become '_', leading and trailing '.'/'_' are removed so
    // no traversal component survives. Falls back to generated_filename()
    // when nothing is left.
    std::string sanitize_filename(std::string_view name);

    std::string generated_filename();

    // Writes through a sibling temporary file and renames it over target.
    // Throws UploadError(StorageError) on failure; target is untouched then.
    void write_file_atomically(const std::filesystem::path &target, std::span<const std::byte> data);
    void write_file_atomically(const std::filesystem::path &target, std::string_view text);

} // namespace filedrop::server
