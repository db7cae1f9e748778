#include "filedrop/server/filesystem.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "filedrop/crypto.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    namespace
    {

        bool is_allowed(unsigned char c)
        {
            return std::isalnum(c) || c == '.' || c == '_' || c == '-';
        }

        bool is_trimmed(char c)
        {
            return c == '.' || c == '_';
        }

    } // namespace

    std::string sanitize_filename(std::string_view name)
    {
        std::string words;
        words.reserve(name.size());
        bool pending_separator = false;
        for (const char ch : name)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c == '/' || c == '\\' || c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f')
            {
                pending_separator = !words.empty();
                continue;
            }
            if (!is_allowed(c))
            {
                continue;
            }
            if (pending_separator)
            {
                words.push_back('_');
                pending_separator = false;
            }
            words.push_back(ch);
        }

        std::size_t begin = 0;
        while (begin < words.size() && is_trimmed(words[begin]))
        {
            ++begin;
        }
        std::size_t end = words.size();
        while (end > begin && is_trimmed(words[end - 1]))
        {
            --end;
        }

        auto result = words.substr(begin, std::min(end - begin, kMaxFilenameLength));
        if (result.empty())
        {
            return generated_filename();
        }
        return result;
    }

    std::string generated_filename()
    {
        return "upload-" + crypto::random_hex(16);
    }

    void write_file_atomically(const std::filesystem::path &target, std::span<const std::byte> data)
    {
        auto temp = target;
        temp += "." + crypto::random_hex(6) + ".tmp";
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw UploadError(filedrop::ErrorCode::StorageError, "Cannot open " + temp.string() + " for writing");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw UploadError(filedrop::ErrorCode::StorageError, "Write failed for " + temp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw UploadError(filedrop::ErrorCode::StorageError,
                              "Cannot move " + temp.string() + " into place: " + ec.message());
        }
    }

    void write_file_atomically(const std::filesystem::path &target, std::string_view text)
    {
        write_file_atomically(target, std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

} // namespace filedrop::server
