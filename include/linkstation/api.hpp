#pragma once
/**
 * @page ls-api Request handlers
 * @file api.hpp
 * @brief Transport-independent request handlers: status code plus JSON body.
 *
 * @details
 * Whatever front end serves HTTP (or the CLI) calls these and writes the reply
 * out. Status codes:
 *   - 200  success, gate preview, or an executed action that failed at the modem
 *          (ok=false in the envelope)
 *   - 400  malformed body or validation failure; nothing was sent to the modem
 *   - 404  unknown control action
 *   - 502  preference query could not reach the modem
 *
 * Telemetry reads never touch the transport; they return whatever snapshot the
 * poller published last.
 */

#include "linkstation/context.hpp"

#include "nlohmann/json.hpp"

#include <string>

namespace linkstation {

struct ApiReply {
  int status{200};
  nlohmann::json body;
};

class Api {
public:
  explicit Api(Context& ctx);

  ApiReply live(bool include_raw = false) const;
  ApiReply info();
  ApiReply health() const;

  ApiReply control(const std::string& action, const nlohmann::json& body);

  ApiReply roaming_state();
  ApiReply network_mode_state();
  ApiReply band_preference_state();

private:
  Context& ctx_;
};

} // namespace linkstation
