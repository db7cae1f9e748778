#include "filedrop/encoding/base64.hpp"

#include <sodium.h>

#include "filedrop/crypto.hpp"

namespace filedrop::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
    }

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        // sodium_base64_ENCODED_LEN includes the trailing NUL.
        std::string output(sodium_base64_ENCODED_LEN(data.size(), kVariant), '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        output.resize(output.size() - 1);
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output(input.size() / 4 * 3 + 3);
        std::size_t decoded = 0;
        const char *end = nullptr;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), " \t\r\n", &decoded, &end, kVariant) != 0)
        {
            return std::nullopt;
        }
        if (end != input.data() + input.size())
        {
            return std::nullopt;
        }
        output.resize(decoded);
        return output;
    }

} // namespace filedrop::encoding
