/**
 * @file json_report.hpp
 * @brief JSON rendering of hf2 results and diagnostic events.
 * @details
 *   Machine-readable counterpart of the key=value lines `hf2-cli` prints.
 *
 *   ## Dual Backend Support
 *   - **Desktop/Linux builds** (no @c ARDUINO defined) use
 *     [nlohmann::json](https://github.com/nlohmann/json).
 *   - **Embedded/Arduino builds** (@c ARDUINO defined) use
 *     [ArduinoJson](https://arduinojson.org/) with a fixed-size
 *     @c StaticJsonDocument, so a device can answer a console query with the
 *     same shape the host tool prints.
 *
 *   ## Shape
 *   @code
 *   {"tag":3,"command":"read_words","error":"ok","status":"ok","status_info":0,
 *    "data":{"words":[1,2,3,4]}}
 *   @endcode
 *   `data` is omitted when the request did not resolve with a reply.
 */
#pragma once

#include <string>
#include "hf2/correlator.hpp"
#include "hf2/diagnostics.hpp"

namespace hf2 {

/// Render a resolved request.
std::string to_json(const Result& result);

/// Render one diagnostic event: {"event":"unexpected_tag","channel":"command","tag":7,"detail":3}.
std::string event_json(const DiagnosticEvent& evt);

} // namespace hf2
