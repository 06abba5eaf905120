// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>

#include "opentelemetry/context/context.h"
#include "opentelemetry/context/runtime_context.h"
#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/nostd/unique_ptr.h"
#include "opentelemetry/trace/span.h"

namespace calltrace {

/**
 * @brief Propagatable handle of one call's span
 *
 * Wraps an OpenTelemetry context carrying the server span (and any baggage
 * extracted from the request). Copies are cheap and refer to the same span.
 *
 * The handle itself is immutable; the only shared state is a one-shot latch
 * that records whether the span has been terminated, so that End() and
 * EndExceptionally() take effect at most once across all copies.
 *
 * Thread Safety: all methods are thread-safe
 */
class TraceContext {
public:
    explicit TraceContext(opentelemetry::context::Context context);

    /// Span of this call (an invalid no-op span if none was started)
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span() const;

    const opentelemetry::context::Context& context() const { return context_; }

    /**
     * @brief Make this context the current one on the calling thread
     *
     * The previous context is restored when the returned token is destroyed:
     * @code
     *   {
     *       auto scope = trace_context.MakeCurrent();
     *       handler->OnMessage(message);
     *   }
     * @endcode
     */
    [[nodiscard]] opentelemetry::nostd::unique_ptr<opentelemetry::context::Token> MakeCurrent() const;

    /// Claims the right to terminate the span; true for the first caller only
    bool TryMarkEnded() const;

    bool HasEnded() const;

private:
    opentelemetry::context::Context context_;
    std::shared_ptr<std::atomic<bool>> ended_;
};

}  // namespace calltrace
