#include "avcparse/common/logger.hpp"

#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/FuncMessageFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Logger.h>

#include <iostream>
#include <memory>
#include <mutex>

namespace avcparse {
namespace logging {
namespace {

struct CallbackAppender : public plog::IAppender {
    LoggingCallback callback;

    void write(const plog::Record& record) override {
        const auto severity = record.getSeverity();
        std::string message = plog::FuncMessageFormatter::format(record);
        if (!message.empty() && message.back() == '\n') {
            message.pop_back();
        }
        if (!callback || !callback(static_cast<Level>(severity), message)) {
            std::cout << plog::severityToString(severity) << " " << message << std::endl;
        }
    }
};

} // namespace

void InitLogger(Level level, LoggingCallback callback) {
    static std::unique_ptr<CallbackAppender> appender;
    const auto severity = static_cast<plog::Severity>(level);
    if (appender) {
        appender->callback = std::move(callback);
        // Only the severity changes.
        InitLogger(severity, nullptr);
    } else if (callback) {
        appender = std::make_unique<CallbackAppender>();
        appender->callback = std::move(callback);
        InitLogger(severity, appender.get());
    } else {
        InitLogger(severity, nullptr);
    }
}

void InitLogger(plog::Severity severity, plog::IAppender* appender) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    static plog::Logger<PLOG_DEFAULT_INSTANCE_ID>* logger = nullptr;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (!logger) {
        logger = &plog::init(severity, appender ? appender : &console_appender);
        PLOG_DEBUG << "avcparse logger initialized";
    } else {
        logger->setMaxSeverity(severity);
        if (appender) {
            logger->addAppender(appender);
        }
    }
}

} // namespace logging
} // namespace avcparse
