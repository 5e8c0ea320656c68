// ============================================================================
// cotree/core/log.cpp - Library Logger Implementation
// ============================================================================

#include "cotree/core/log.hpp"

#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>

namespace cotree {

namespace {

constexpr const char* kLoggerName = "cotree";
constexpr const char* kSinkName = "cotree.console";
constexpr const char* kLevelVariable = "COTREE_LOG_LEVEL";

quill::Logger*& Slot() {
    static quill::Logger* logger = nullptr;
    return logger;
}

quill::Logger* MakeDefaultLogger() {
    quill::Backend::start();
    if (quill::Logger* existing = quill::Frontend::get_logger(kLoggerName)) {
        return existing;
    }
    auto sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>(kSinkName);
    quill::Logger* logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sink));
    logger->set_log_level(quill::LogLevel::Warning);
    return logger;
}

std::optional<quill::LogLevel> ParseLevel(std::string_view text) {
    if (text == "trace") return quill::LogLevel::TraceL1;
    if (text == "debug") return quill::LogLevel::Debug;
    if (text == "info") return quill::LogLevel::Info;
    if (text == "notice") return quill::LogLevel::Notice;
    if (text == "warn" || text == "warning") return quill::LogLevel::Warning;
    if (text == "error") return quill::LogLevel::Error;
    if (text == "critical") return quill::LogLevel::Critical;
    if (text == "off" || text == "none") return quill::LogLevel::None;
    return std::nullopt;
}

}  // namespace

quill::Logger* Logger() {
    auto& slot = Slot();
    if (!slot) {
        slot = MakeDefaultLogger();
    }
    return slot;
}

void SetLogger(quill::Logger* logger) {
    Slot() = logger ? logger : MakeDefaultLogger();
}

void SetLogLevel(quill::LogLevel level) {
    Logger()->set_log_level(level);
}

void LoadLogLevelFromEnv() {
    const char* value = std::getenv(kLevelVariable);
    if (value == nullptr || *value == '\0') {
        return;
    }
    auto level = ParseLevel(value);
    if (!level) {
        LOG_WARNING(Logger(), "ignoring {}={}: unknown level", kLevelVariable, value);
        return;
    }
    SetLogLevel(*level);
}

}  // namespace cotree
