// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/trace_context.h"

#include <utility>

#include "opentelemetry/trace/context.h"

namespace calltrace {

namespace context_api = opentelemetry::context;

TraceContext::TraceContext(context_api::Context context)
    : context_(std::move(context)), ended_(std::make_shared<std::atomic<bool>>(false)) {}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> TraceContext::span() const {
    return opentelemetry::trace::GetSpan(context_);
}

opentelemetry::nostd::unique_ptr<context_api::Token> TraceContext::MakeCurrent() const {
    return context_api::RuntimeContext::Attach(context_);
}

bool TraceContext::TryMarkEnded() const {
    bool expected = false;
    return ended_->compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

bool TraceContext::HasEnded() const {
    return ended_->load(std::memory_order_acquire);
}

}  // namespace calltrace
