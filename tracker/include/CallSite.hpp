#pragma once
#include <cstddef>
#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

namespace fc {

    // Identity of *where* a first-time check happens.
    // The parts are stored separately and compared field by field, so
    // ("a", 1, 23) and ("a1", 2, 3) never alias.
    class CallSiteId {
    public:
        enum class Kind : std::uint8_t {
            Location, // file/line/column captured from the source
            Token     // caller-chosen string, uniqueness is the caller's job
        };

        static CallSiteId fromLocation(std::string_view file,
                                       std::uint32_t line,
                                       std::uint32_t column);

        // nullptr file is treated as ""
        static CallSiteId fromLocation(const char* file,
                                       std::uint32_t line,
                                       std::uint32_t column);

        static CallSiteId fromToken(std::string_view token);

        // nullptr token is treated as ""
        static CallSiteId fromToken(const char* token);

        static CallSiteId current(
            const std::source_location& loc = std::source_location::current());

        Kind               kind()   const noexcept { return kind_; }
        const std::string& name()   const noexcept { return name_; }  // file or token
        std::uint32_t      line()   const noexcept { return line_; }
        std::uint32_t      column() const noexcept { return column_; }

        bool operator==(const CallSiteId& other) const = default;

        std::size_t hash() const noexcept;

    private:
        CallSiteId(Kind kind, std::string name,
                   std::uint32_t line, std::uint32_t column);

        Kind          kind_   = Kind::Token;
        std::string   name_;
        std::uint32_t line_   = 0;
        std::uint32_t column_ = 0;
    };

    struct CallSiteIdHash {
        std::size_t operator()(const CallSiteId& id) const noexcept { return id.hash(); }
    };

    // "file:line:column" or "token:<text>". For logs only, never a key.
    std::string describe(const CallSiteId& id);

} // namespace fc
