//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PERFBUDGETREGISTRY_RESULT_HPP
#define PERFBUDGETREGISTRY_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type for error handling without exceptions.
 *
 * Result<T, E> holds either a success value of type T or an error value of
 * type E. Loaders for budget files and measurement batches return it so
 * that callers must branch on failure explicitly.
 *
 * Usage:
 * @code
 *     auto samples = budgets::load_measurements("samples.json");
 *     if (samples.is_ok()) {
 *         auto verdicts = evaluator.measure_all(samples.value());
 *     } else {
 *         std::cerr << samples.error() << std::endl;
 *     }
 * @endcode
 *
 * Chaining:
 * @code
 *     auto samples = json_utils::read_file(path).and_then(budgets::measurements_from_json);
 * @endcode
 */

#include "pbr/error.hpp"

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace pbr {

    /**
     * Tag type for constructing a success Result.
     */
    struct SuccessTag {};

    /**
     * Tag type for constructing a failure Result.
     */
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * A type that represents either a successful value or an error.
     *
     * @tparam T The type of the success value.
     * @tparam E The type of the error value. Defaults to Error.
     *
     * Result is never empty; it always contains either a T or an E.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        Result(const Result&) = default;
        Result(Result&&) noexcept = default;
        Result& operator=(const Result&) = default;
        Result& operator=(Result&&) noexcept = default;
        ~Result() = default;

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * Returns a reference to the success value.
         * @throws std::logic_error if the Result contains an error.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns a reference to the error value.
         * @throws std::logic_error if the Result contains a success value.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        /**
         * Applies a function that returns a Result to the success value.
         *
         * @tparam F A callable that takes T and returns Result<U, E>.
         * @return The result of f(value) or the original error.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using ResultType = std::invoke_result_t<F, T&&>;
            return ResultType::failure(std::get<1>(std::move(data_)));
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Specialization for operations that can fail but return nothing.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) : error_(std::nullopt) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        Result(const Result&) = default;
        Result(Result&&) noexcept = default;
        Result& operator=(const Result&) = default;
        Result& operator=(Result&&) noexcept = default;
        ~Result() = default;

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace pbr

#endif //PERFBUDGETREGISTRY_RESULT_HPP
