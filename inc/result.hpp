#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace NReservation {

    enum class EErrorKind {
        Validation,
        NotFound,
        Conflict,
        InvalidReference,
        IllegalTransition,
        StoreUnavailable
    };

    struct TError {
        EErrorKind Kind;
        std::string Message;
    };

    const char* ErrorKindName(EErrorKind kind);

    // Either a value or a tagged failure. Callers switch on Error().Kind.
    template <typename T>
    class TResult {
    public:
        static TResult Ok(T value) {
            return TResult(std::in_place_index<0>, std::move(value));
        }

        static TResult Err(EErrorKind kind, std::string message) {
            return TResult(std::in_place_index<1>, TError{kind, std::move(message)});
        }

        static TResult Err(TError error) {
            return TResult(std::in_place_index<1>, std::move(error));
        }

        bool IsOk() const {
            return State.index() == 0;
        }

        bool IsErr() const {
            return !IsOk();
        }

        explicit operator bool() const {
            return IsOk();
        }

        const T& Value() const& {
            return std::get<0>(State);
        }

        T& Value() & {
            return std::get<0>(State);
        }

        T&& Value() && {
            return std::get<0>(std::move(State));
        }

        const TError& Error() const {
            return std::get<1>(State);
        }

    private:
        template <std::size_t I, typename U>
        TResult(std::in_place_index_t<I> tag, U&& value)
            : State(tag, std::forward<U>(value)) {
        }

        std::variant<T, TError> State;
    };

    template <>
    class TResult<void> {
    public:
        static TResult Ok() {
            return TResult(TOkTag{});
        }

        static TResult Err(EErrorKind kind, std::string message) {
            return TResult(TError{kind, std::move(message)});
        }

        static TResult Err(TError error) {
            return TResult(std::move(error));
        }

        bool IsOk() const {
            return Ok_;
        }

        bool IsErr() const {
            return !Ok_;
        }

        explicit operator bool() const {
            return Ok_;
        }

        const TError& Error() const {
            return Error_;
        }

    private:
        struct TOkTag {};

        explicit TResult(TOkTag)
            : Ok_(true) {
        }

        explicit TResult(TError error)
            : Ok_(false)
            , Error_(std::move(error)) {
        }

        bool Ok_;
        TError Error_{EErrorKind::Validation, {}};
    };

} // namespace NReservation
