#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <expected>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace kiln {

struct EvaluationError {
    enum class Kind : uint8_t { Failed, WouldSuspend, Cycle };

    Kind kind = Kind::Failed;
    std::string message;
};

/** @brief A value that resolves later, shared by every accessor that meets it. */
template <typename T>
using Pending = std::shared_future<T>;

/** @brief What a factory produces: the value now, or a pending value. */
template <typename T>
using FactoryResult = std::variant<T, Pending<T>>;

/**
 * @brief Handle on an unresolved pending value, independent of its type.
 */
class Suspension {
public:
    template <typename T>
    explicit Suspension(Pending<T> pending)
        : wait_([pending] { pending.wait(); }),
          ready_([pending] { return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }) {
    }

    void wait() const {
        wait_();
    }
    bool ready() const {
        return ready_();
    }

private:
    std::function<void()> wait_;
    std::function<bool()> ready_;
};

/** @brief Outcome of one non-blocking step: done, suspended on a pending value, or failed. */
using Advance = std::expected<std::optional<Suspension>, EvaluationError>;

/** @brief Type-erased lazy value, used as a dependency of other lazy values. */
class LazyNode {
public:
    virtual ~LazyNode() = default;

    /** @brief Drives evaluation as far as it can go without blocking. */
    virtual Advance advance() = 0;

    virtual const std::string &label() const = 0;
};

/**
 * @brief Memoizing lazy value.
 *
 * Dependencies are driven to completion, in order, before the factory runs. The factory runs
 * at most once; a pending result is shared with every accessor until it resolves, after which
 * the value is cached permanently. A failure is cached the same way.
 */
template <typename T>
class LazyElement final : public LazyNode {
public:
    using Factory = std::function<FactoryResult<T>()>;
    using DepsFn = std::function<std::vector<std::shared_ptr<LazyNode>>()>;

    LazyElement(std::string label, Factory factory, DepsFn deps = {})
        : label_(std::move(label)), factory_(std::move(factory)), deps_(std::move(deps)) {
    }

    const std::string &label() const override {
        return label_;
    }

    Advance advance() override {
        std::unique_lock lock(mtx_);
        while (state_ == State::Evaluating) {
            if (owner_ == std::this_thread::get_id())
                return std::unexpected(EvaluationError{EvaluationError::Kind::Cycle,
                                                       std::format("circular evaluation of {}", label_)});
            cv_.wait(lock);
        }

        switch (state_) {
        case State::Cached:
            return std::nullopt;
        case State::Failed:
            return std::unexpected(*error_);
        case State::Pending:
            return settle(lock);
        default:
            break;
        }

        state_ = State::Evaluating;
        owner_ = std::this_thread::get_id();
        lock.unlock();

        std::optional<Suspension> suspended;
        std::optional<EvaluationError> error;
        std::optional<FactoryResult<T>> produced;
        if (deps_) {
            for (const auto &dep : deps_()) {
                Advance step = dep->advance();
                if (!step) {
                    error = step.error();
                    break;
                }
                if (*step) {
                    suspended = std::move(*step);
                    break;
                }
            }
        }
        if (!error && !suspended) {
            try {
                produced = factory_();
            } catch (const std::exception &e) {
                error = EvaluationError{EvaluationError::Kind::Failed, std::format("{}: {}", label_, e.what())};
            }
        }

        lock.lock();
        owner_ = {};
        if (error) {
            state_ = State::Failed;
            error_ = std::move(error);
            cv_.notify_all();
            return std::unexpected(*error_);
        }
        if (suspended) {
            state_ = State::Unevaluated;
            cv_.notify_all();
            return suspended;
        }
        if (auto *value = std::get_if<T>(&*produced)) {
            state_ = State::Cached;
            cache_ = std::move(*value);
            cv_.notify_all();
            return std::nullopt;
        }
        state_ = State::Pending;
        pending_ = std::get<Pending<T>>(std::move(*produced));
        cv_.notify_all();
        return settle(lock);
    }

    /** @brief The cached value, once evaluation has completed. */
    std::optional<T> cached() const {
        std::lock_guard lock(mtx_);
        return cache_;
    }

    bool is_pending() const {
        std::lock_guard lock(mtx_);
        return state_ == State::Pending;
    }

private:
    enum class State : uint8_t { Unevaluated, Evaluating, Pending, Cached, Failed };

    // Called with the lock held while a pending value is in flight.
    Advance settle(std::unique_lock<std::mutex> &) {
        if (!pending_->valid())
            return fail("pending value has no shared state");
        if (pending_->wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            return Suspension(*pending_);
        try {
            cache_ = pending_->get();
        } catch (const std::exception &e) {
            pending_.reset();
            return fail(e.what());
        }
        pending_.reset();
        state_ = State::Cached;
        return std::nullopt;
    }

    Advance fail(std::string_view reason) {
        state_ = State::Failed;
        error_ = EvaluationError{EvaluationError::Kind::Failed, std::format("{}: {}", label_, reason)};
        return std::unexpected(*error_);
    }

    std::string label_;
    Factory factory_;
    DepsFn deps_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    State state_ = State::Unevaluated;
    std::thread::id owner_;
    std::optional<T> cache_;
    std::optional<Pending<T>> pending_;
    std::optional<EvaluationError> error_;
};

/**
 * @brief Evaluates without ever blocking.
 * @return The value, or WouldSuspend as soon as an unresolved pending value is met.
 */
template <typename T>
std::expected<T, EvaluationError> evaluate_sync(LazyElement<T> &element) {
    Advance step = element.advance();
    if (!step)
        return std::unexpected(step.error());
    if (*step)
        return std::unexpected(EvaluationError{
            EvaluationError::Kind::WouldSuspend,
            std::format("{} depends on a pending value and cannot be evaluated synchronously", element.label())});
    return *element.cached();
}

/** @brief Evaluates, waiting on every pending value met along the way. */
template <typename T>
std::expected<T, EvaluationError> evaluate_async(LazyElement<T> &element) {
    while (true) {
        Advance step = element.advance();
        if (!step)
            return std::unexpected(step.error());
        if (!*step)
            return *element.cached();
        (*step)->wait();
    }
}

} // namespace kiln
