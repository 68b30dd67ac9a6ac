#pragma once
#include <string>
#include "CallSite.hpp"
namespace fc {

    // Escapes '\\', '"' and control characters for a JSON string body
    std::string json_escape(const std::string& s);

    // {"kind":"location","file":"...","line":N,"column":N}
    // {"kind":"token","token":"..."}
    std::string make_callsite_json(const CallSiteId& id);

    // Envelope: {"type":"TYPE","payload":{...}}
    // payload_object_json MUST already be a JSON object
    std::string make_message_json(const char* type, const std::string& payload_object_json);

} // namespace fc
