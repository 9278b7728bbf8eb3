#include "fedlink/logging/StructuredLogger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fedlink::logging {

namespace {

std::string escape_control_characters(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

int rank(Level level) {
    return static_cast<int>(level);
}

}  // namespace

StructuredLogger::StructuredLogger()
    : StructuredLogger(std::clog) {}

StructuredLogger::StructuredLogger(std::ostream& sink, Level minimum_level)
    : sink_(&sink), minimum_level_(minimum_level) {}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || rank(level) < rank(minimum_level_)) {
        return;
    }

    std::ostringstream oss;
    oss << '{'
        << "\"ts\":\"" << escape_json(format_timestamp()) << "\",";
    oss << "\"level\":\"" << escape_json(level_to_string(level)) << "\",";
    oss << "\"event\":\"" << escape_json(event) << "\"";

    if (!fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto& [key, value] = fields[i];
            oss << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
            if (i + 1 < fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }

    oss << "}\n";
    *sink_ << oss.str();
    sink_->flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_level_ = level;
}

Level StructuredLogger::minimum_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return minimum_level_;
}

std::string StructuredLogger::escape_json(std::string_view value) {
    return escape_control_characters(value);
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

bool level_from_string(std::string_view text, Level& level) {
    if (text == "debug") {
        level = Level::Debug;
    } else if (text == "info") {
        level = Level::Info;
    } else if (text == "warning" || text == "warn") {
        level = Level::Warning;
    } else if (text == "error") {
        level = Level::Error;
    } else {
        return false;
    }
    return true;
}

}  // namespace fedlink::logging
