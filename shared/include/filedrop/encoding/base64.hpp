#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filedrop::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // std::nullopt when the input is not canonical padded base64.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace filedrop::encoding
