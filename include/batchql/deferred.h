#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/deferred.h — Single-assignment result cells
// ═══════════════════════════════════════════════════════════════════
//
//  A Deferred starts Pending and settles exactly once, either with a
//  value or with an error message. The batch scheduler hands one out
//  per pending field request; the dedup cache shares one between all
//  requests with the same key.
//
//  Deferred is not thread-safe. Work finishing on another thread
//  settles it through OperationContext::post().
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace batchql::graphql {

class Deferred {
public:
    enum class State { Pending, Fulfilled, Rejected };

    using Callback = std::function<void(const Deferred&)>;

    Deferred() = default;
    Deferred(const Deferred&) = delete;
    Deferred& operator=(const Deferred&) = delete;

    // ── Settle; returns false when already settled ──
    bool resolve(nlohmann::json value) {
        if (state_ != State::Pending) return false;
        value_ = std::move(value);
        state_ = State::Fulfilled;
        fire();
        return true;
    }

    bool reject(std::string message) {
        if (state_ != State::Pending) return false;
        error_ = std::move(message);
        state_ = State::Rejected;
        fire();
        return true;
    }

    // ── Run callback once settled (immediately if it already is) ──
    void then(Callback callback) {
        if (state_ == State::Pending) {
            callbacks_.push_back(std::move(callback));
        } else {
            callback(*this);
        }
    }

    State state() const { return state_; }
    bool settled() const { return state_ != State::Pending; }
    bool fulfilled() const { return state_ == State::Fulfilled; }
    bool rejected() const { return state_ == State::Rejected; }

    const nlohmann::json& value() const { return value_; }
    const std::string& error() const { return error_; }

    static std::shared_ptr<Deferred> resolved(nlohmann::json value) {
        auto d = std::make_shared<Deferred>();
        d->resolve(std::move(value));
        return d;
    }

    static std::shared_ptr<Deferred> rejectedWith(std::string message) {
        auto d = std::make_shared<Deferred>();
        d->reject(std::move(message));
        return d;
    }

private:
    State state_ = State::Pending;
    nlohmann::json value_;
    std::string error_;
    std::vector<Callback> callbacks_;

    void fire() {
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& cb : callbacks) cb(*this);
    }
};

using DeferredPtr = std::shared_ptr<Deferred>;

// ═══════════════════════════════════════════
//  FieldValue
//  What a resolver or batch function returns: a value available now,
//  or a Deferred that settles later in the operation.
// ═══════════════════════════════════════════
class FieldValue {
public:
    FieldValue() : value_(nullptr) {}
    FieldValue(nlohmann::json value) : value_(std::move(value)) {}
    FieldValue(const JsonValue& value) : value_(value.raw()) {}
    FieldValue(DeferredPtr deferred) : deferred_(std::move(deferred)) {}

    bool isDeferred() const { return deferred_ != nullptr; }

    const nlohmann::json& value() const { return value_; }
    const DeferredPtr& deferred() const { return deferred_; }

    // Deferred view of either form.
    DeferredPtr toDeferred() const {
        return deferred_ ? deferred_ : Deferred::resolved(value_);
    }

private:
    nlohmann::json value_;
    DeferredPtr deferred_;
};

} // namespace batchql::graphql
