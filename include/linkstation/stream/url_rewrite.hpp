#pragma once
/**
 * @file url_rewrite.hpp
 * @brief Public-address mapping for locations found in media metadata.
 *
 * The media service hands out locations on the isolated segment: camera streams
 * (rtsp://user:pw@192.168.11.103:554/stream1), its own HLS and recording URLs
 * (http://192.168.99.11:8787/live/...), camera snapshots. Clients only reach the
 * gateway, so every such location is rewritten or dropped:
 *
 * STREAM SCHEMES (rtsp, rtsps, rtmp)
 * ----------------------------------
 * Each camera is exposed on its own public port:
 *
 *     port = public_base_port + last_octet(id) - octet_base
 *
 * Scheme, user info, path, query and fragment are kept; only host:port changes.
 *
 * OTHER SCHEMES ON AN INTERNAL HOST
 * ---------------------------------
 * A host is internal when it is the media service's own host, the camera id in
 * scope, or a private / loopback / link-local address. http(s) paths the gateway
 * serves itself become gateway-relative paths:
 *
 *     /live/{id}/{profile}/{file}          -> same path
 *     /v1/recordings/{id}/files/{d}/{f}    -> /v1/nvr/recordings/{id}/files/{d}/{f}
 *
 * Anything else on an internal host is replaced by null. Absolute locations on
 * public hosts are left alone.
 */

#include "nlohmann/json.hpp"

#include <optional>
#include <string>

namespace linkstation::stream {

struct PublicEndpoint {
  std::string host;
  int base_port{9550};
  int octet_base{100};
};

/// Public port for camera `id`, nullopt when there is no deterministic mapping.
std::optional<int> public_port(const std::string& id, const PublicEndpoint& ep);

/// True for absolute rtsp/rtsps/rtmp locations.
bool is_stream_location(const std::string& s);

/// Lower-cased host of an absolute `scheme://` location; empty when `s` is not one.
std::string location_host(const std::string& s);

/// Private, loopback or link-local IP literal (IPv4 dotted quad or bracketed IPv6).
bool is_private_address(const std::string& host);

/// Rewrite one absolute stream location; nullopt when unmappable or not parseable.
std::optional<std::string> rewrite_location(const std::string& url, const std::string& id,
                                            const PublicEndpoint& ep);

/// Gateway-relative path for an internal http(s) location; nullopt when the gateway does not serve it.
std::optional<std::string> gateway_path(const std::string& url);

/**
 * @brief Walk a metadata document and rewrite every location in place.
 *
 * The camera identifier for a location is the nearest enclosing object's "ip"
 * string, falling back to `id`. `upstream_host` is the media service host
 * (see location_host()). Unmappable internal locations become null.
 * @return number of locations touched (rewritten or nulled)
 */
std::size_t rewrite_locations(nlohmann::json& doc, const std::string& id, const PublicEndpoint& ep,
                              const std::string& upstream_host = std::string());

/// Path component check: non-empty, no "..", separators, URL delimiters, spaces or control bytes.
bool safe_component(const std::string& s);

} // namespace linkstation::stream
