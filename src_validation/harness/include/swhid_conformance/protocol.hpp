#pragma once

#include <string>

#include "error_kind.hpp"
#include "implementation.hpp"
#include "sandbox.hpp"

namespace swhid::conformance::protocol {

/**
 * Wire helpers shared by the bridges.
 *
 * Plain framing: stdout carries exactly one identifier; a single trailing `\n` or `\r\n` is
 * framing and is removed, anything else (empty output, extra lines) is a protocol violation.
 *
 * JSON framing:
 *   request  {"op":"compute","payload_path":...,"obj_type":...,"variant":...,...}
 *   response {"ok":true,"swhid":"swh:1:..."}
 *            {"ok":false,"error":{"code":"COMPUTE_ERROR","subtype":...,"message":...}}
 *
 * An error response is honoured whether the child exits zero or not; a non-zero exit whose
 * stdout is not an error response is passed through unchanged.
 */
[[nodiscard]] RawOutcome frame_plain(RawOutcome raw);

[[nodiscard]] RawOutcome decode_json_response(RawOutcome raw);

[[nodiscard]] std::string encode_json_request(const ComputeRequest& request);

}  // namespace swhid::conformance::protocol
