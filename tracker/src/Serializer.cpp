#include "../include/Serializer.hpp"
#include <cstdio>
#include <string>

namespace fc {

  std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size()+8);
    for (char c : s) {
      if (c=='\\' || c=='\"') {
        out.push_back('\\');
        out.push_back(c);
      }
      else if (c=='\n') out += "\\n";
      else if (c=='\t') out += "\\t";
      else if (c=='\r') out += "\\r";
      else if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      }
      else out.push_back(c);
    }
    return out;
  }

  std::string make_callsite_json(const CallSiteId& id){
    if (id.kind() == CallSiteId::Kind::Token) {
      return "{\"kind\":\"token\",\"token\":\"" + json_escape(id.name()) + "\"}";
    }
    std::string j = "{\"kind\":\"location\",";
    j += "\"file\":\""+json_escape(id.name())+"\",";
    j += "\"line\":"+std::to_string(id.line())+",";
    j += "\"column\":"+std::to_string(id.column())+"}";
    return j;
  }

  std::string make_message_json(const char* type, const std::string& payload){
    std::string j = "{\"type\":\"";
    j += json_escape(type ? type : "");
    j += "\",\"payload\":";
    j += payload; // payload is already a JSON object
    j += "}";
    return j;
  }

} // namespace fc
