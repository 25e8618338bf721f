#pragma once
/**
 * @file json_codec.hpp
 * @brief JSON shapes of the external interface: telemetry, identity, control envelopes.
 *
 * Absent optionals are written as null, never omitted, so clients can rely on
 * every documented key being present. Timestamps are Unix milliseconds.
 */

#include "linkstation/actions.hpp"
#include "linkstation/planner.hpp"
#include "linkstation/telemetry.hpp"
#include "linkstation/transport/at_transport.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace linkstation::codec {

using json = nlohmann::json;

std::int64_t to_ms(std::chrono::system_clock::time_point t);
std::int64_t now_ms();

json to_json(const TelemetryRecord& rec);
json to_json(const ModemInfo& info);
json to_json(const transport::CommandExchange& ex);

/**
 * @brief Live telemetry response.
 *
 * `snap` may be null (no cycle published yet): ok=true, cycle=null, every data
 * field null. `include_raw` adds the per-command reply lines when they were kept.
 */
json live_response(const std::shared_ptr<const TelemetrySnapshot>& snap, bool include_raw);

/// Control envelope for a planned / blocked / executed action.
json envelope(const ControlAction& a);

/// Control envelope for a request rejected by validation (nothing planned).
json rejected_envelope(ActionKind kind, const std::string& error);

/**
 * @brief Build an ActionRequest from a request body.
 *
 * Field names follow the HTTP contract (`lte_ca_enable`, `auth.type`, ...);
 * band lists are strings for `band` and integers for `band_preference`.
 * Unknown keys are ignored. false + err on a wrong type or a missing required key.
 */
bool parse_request(ActionKind kind, const json& body, ActionRequest& out, std::string& err);

} // namespace linkstation::codec
