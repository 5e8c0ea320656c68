// ============================================================================
// cotree/core/result.hpp - Value-or-Error Return Type
// ============================================================================
//
// Result<T, E> holds either a success value or an error. Every fallible cotree
// operation returns one, and node bodies report their outcome through
// Result<std::any, Fault> (alias NodeResult in task_node.hpp).
//
// Ok(v) / Err(e) build tags that convert into any Result whose T / E can be
// constructed from the tagged value, so a body declared as returning
// NodeResult can simply `co_return Ok(42);`.
//
// USAGE:
// ------
//   Result<std::shared_ptr<Job>, Error> job = SubmitJob(parent, "fetch", Fetch);
//   if (job.IsErr()) {
//       LOG_WARNING(Logger(), "submit failed: {}", job.Error().message());
//   }
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace cotree {

template <typename T, typename E>
class Result;

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Precondition: IsOk()
    T& Value() & { return *std::get_if<0>(&data_); }
    const T& Value() const& { return *std::get_if<0>(&data_); }
    T&& Value() && { return std::move(*std::get_if<0>(&data_)); }

    // Precondition: IsErr()
    E& Error() & { return *std::get_if<1>(&data_); }
    const E& Error() const& { return *std::get_if<1>(&data_); }
    E&& Error() && { return std::move(*std::get_if<1>(&data_)); }

    T ValueOr(T fallback) const {
        if (IsOk()) return Value();
        return fallback;
    }

    template <typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        if (IsOk()) {
            return Ok(func(std::move(*this).Value()));
        }
        return Err(std::move(*this).Error());
    }

    template <typename F>
    auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E&&>> {
        if (IsErr()) {
            return Err(func(std::move(*this).Error()));
        }
        return Ok(std::move(*this).Value());
    }

    template <typename F>
    auto AndThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (IsOk()) {
            return func(std::move(*this).Value());
        }
        return Err(std::move(*this).Error());
    }

   private:
    std::variant<T, E> data_;
};

// Result<void, E>: success carries nothing
template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

}  // namespace cotree
