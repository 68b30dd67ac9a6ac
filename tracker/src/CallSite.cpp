#include "../include/CallSite.hpp"
#include <functional>
#include <utility>

namespace fc {

  // boost::hash_combine style mixing
  static inline void hash_combine(std::size_t& seed, std::size_t h) noexcept {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  }

  CallSiteId::CallSiteId(Kind kind, std::string name,
                         std::uint32_t line, std::uint32_t column)
    : kind_(kind), name_(std::move(name)), line_(line), column_(column) {}

  CallSiteId CallSiteId::fromLocation(std::string_view file,
                                      std::uint32_t line,
                                      std::uint32_t column) {
    return CallSiteId(Kind::Location, std::string(file), line, column);
  }

  CallSiteId CallSiteId::fromLocation(const char* file,
                                      std::uint32_t line,
                                      std::uint32_t column) {
    return fromLocation(std::string_view(file ? file : ""), line, column);
  }

  CallSiteId CallSiteId::fromToken(std::string_view token) {
    return CallSiteId(Kind::Token, std::string(token), 0, 0);
  }

  CallSiteId CallSiteId::fromToken(const char* token) {
    return fromToken(std::string_view(token ? token : ""));
  }

  CallSiteId CallSiteId::current(const std::source_location& loc) {
    return fromLocation(loc.file_name(), loc.line(), loc.column());
  }

  std::size_t CallSiteId::hash() const noexcept {
    std::size_t seed = std::hash<std::string>{}(name_);
    hash_combine(seed, static_cast<std::size_t>(kind_));
    hash_combine(seed, std::hash<std::uint32_t>{}(line_));
    hash_combine(seed, std::hash<std::uint32_t>{}(column_));
    return seed;
  }

  std::string describe(const CallSiteId& id) {
    if (id.kind() == CallSiteId::Kind::Token) {
      return "token:" + id.name();
    }
    std::string out = id.name();
    out += ":";
    out += std::to_string(id.line());
    out += ":";
    out += std::to_string(id.column());
    return out;
  }

} // namespace fc
