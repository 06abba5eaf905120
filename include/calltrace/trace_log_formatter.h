/**
 * @file trace_log_formatter.h
 * @brief spdlog formatter that tags log lines with the current call's trace context
 *
 * Every log line written while a call's TraceContext is current (that is,
 * from inside a traced handler or listener callback) gets the call's
 * trace_id and span_id appended, so logs and spans can be joined.
 *
 * Usage:
 * @code
 * #include "calltrace/trace_log_formatter.h"
 *
 * calltrace::SetTraceLogging();
 * spdlog::info("handled");  // ... [info] handled [trace_id=...] [span_id=...]
 * @endcode
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/spdlog.h>

#include "opentelemetry/context/runtime_context.h"
#include "opentelemetry/trace/context.h"
#include "opentelemetry/trace/span_context.h"

namespace calltrace {

/**
 * @class TraceLogFormatter
 * @brief Wraps a pattern formatter and appends " [trace_id=…] [span_id=…]"
 *
 * Nothing is appended when no valid span is current.
 *
 * Thread Safety: the current context is thread-local, each thread sees its own call
 */
class TraceLogFormatter : public spdlog::formatter {
public:
    explicit TraceLogFormatter(const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v")
        : pattern_(pattern),
          base_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern)) {}

    void format(const spdlog::details::log_msg& msg, spdlog::memory_buf_t& dest) override {
        spdlog::memory_buf_t base_msg;
        base_formatter_->format(msg, base_msg);

        std::string trace_context = CurrentTraceContext();
        if (trace_context.empty()) {
            dest.append(base_msg.data(), base_msg.data() + base_msg.size());
            return;
        }

        // Insert before the trailing end-of-line
        size_t body_size = base_msg.size();
        bool has_eol = body_size > 0 && base_msg.data()[body_size - 1] == '\n';
        if (has_eol) {
            --body_size;
        }
        dest.append(base_msg.data(), base_msg.data() + body_size);
        dest.append(trace_context.data(), trace_context.data() + trace_context.size());
        if (has_eol) {
            dest.push_back('\n');
        }
    }

    std::unique_ptr<spdlog::formatter> clone() const override {
        return std::make_unique<TraceLogFormatter>(pattern_);
    }

    /**
     * @brief " [trace_id=<32 hex>] [span_id=<16 hex>]" of the current span, or ""
     */
    static std::string CurrentTraceContext() {
        auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
        auto span_context = span->GetContext();
        if (!span_context.IsValid()) {
            return "";
        }

        char trace_id[32];
        char span_id[16];
        span_context.trace_id().ToLowerBase16(trace_id);
        span_context.span_id().ToLowerBase16(span_id);

        std::string result = " [trace_id=";
        result.append(trace_id, sizeof(trace_id));
        result.append("] [span_id=");
        result.append(span_id, sizeof(span_id));
        result.append("]");
        return result;
    }

private:
    std::string pattern_;
    std::unique_ptr<spdlog::formatter> base_formatter_;
};

/**
 * @brief Install TraceLogFormatter on the default logger
 */
inline void SetTraceLogging() {
    spdlog::set_formatter(std::make_unique<TraceLogFormatter>());
}

/**
 * @brief Install TraceLogFormatter on a named logger, if it exists
 */
inline void SetTraceLogging(const std::string& logger_name) {
    auto logger = spdlog::get(logger_name);
    if (logger) {
        logger->set_formatter(std::make_unique<TraceLogFormatter>());
    }
}

}  // namespace calltrace
