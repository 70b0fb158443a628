#pragma once
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>
#include "../non_copyable.hpp"

namespace server {

    /// @brief Lazy, single pass coroutine generator.
    /// The body does not run until the first next_value() call and runs only up to the following co_yield.
    template <typename T>
    class Generator : NonCopyable {
        public:
            class promise_type;
            using handle_type = std::coroutine_handle<promise_type>;
        private:
            handle_type c_handle;
            explicit Generator(handle_type h) : c_handle(h) {};
        public:
            class promise_type {
                public:
                    std::optional<T> current;
                    std::exception_ptr exception;

                    std::suspend_always initial_suspend() noexcept { return {}; }
                    std::suspend_always final_suspend() noexcept { return {}; }

                    void unhandled_exception() noexcept {
                        exception = std::current_exception();
                    }
                    void return_void() noexcept {}

                    std::suspend_always yield_value(T value) {
                        current.emplace(std::move(value));
                        return {};
                    }

                    Generator get_return_object() { return Generator{handle_type::from_promise(*this)}; }
            };

            /// @brief Resumes the body until the next co_yield
            /// @return yielded value or std::nullopt once the body has finished
            std::optional<T> next_value() {
                if (!c_handle || c_handle.done()) {
                    return std::nullopt;
                }
                auto &promise = c_handle.promise();
                promise.current.reset();
                c_handle.resume();
                if (promise.exception) {
                    auto exception = std::exchange(promise.exception, nullptr);
                    std::rethrow_exception(exception);
                }
                if (c_handle.done()) {
                    return std::nullopt;
                }
                return std::move(promise.current);
            }

            bool done() const noexcept {
                return !c_handle || c_handle.done();
            }

            Generator(Generator &&other) noexcept : c_handle(std::exchange(other.c_handle, nullptr)) {}

            Generator &operator=(Generator &&other) noexcept {
                if (this != &other) {
                    if (c_handle) {
                        c_handle.destroy();
                    }
                    c_handle = std::exchange(other.c_handle, nullptr);
                }
                return *this;
            }

            ~Generator() {
                if (c_handle) {
                    c_handle.destroy();
                }
            }
    };
}
