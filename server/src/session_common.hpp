#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "filedrop/protocol.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server::session_common
{

    filedrop::protocol::StatsSnapshot to_snapshot(const UploadStats &stats);

    filedrop::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id);

} // namespace filedrop::server::session_common
