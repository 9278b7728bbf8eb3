#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fedlink::logging {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

using Field = std::pair<std::string, std::string>;
using FieldList = std::vector<Field>;

class EventLog {
public:
    virtual ~EventLog() = default;

    virtual void log(Level level, std::string_view event, FieldList fields = {}) = 0;
};

// Writes one JSON object per event: {"ts":..,"level":..,"event":..,"fields":{..}}.
class StructuredLogger final : public EventLog {
public:
    StructuredLogger();
    explicit StructuredLogger(std::ostream& sink, Level minimum_level = Level::Info);

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    void log(Level level, std::string_view event, FieldList fields = {}) override;

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);
    [[nodiscard]] Level minimum_level() const noexcept;

private:
    static std::string escape_json(std::string_view value);
    static std::string format_timestamp();

    std::ostream* sink_;
    Level minimum_level_{Level::Info};
    bool enabled_{true};
    mutable std::mutex mutex_;
};

std::string level_to_string(Level level);
bool level_from_string(std::string_view text, Level& level);

}  // namespace fedlink::logging
