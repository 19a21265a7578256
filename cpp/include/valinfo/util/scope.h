#ifndef VALINFO_SCOPE_H
#define VALINFO_SCOPE_H

#include <utility>

namespace valinfo {

    /**
     * Runs a callable when the enclosing scope is left, by any path. Used to pair C resource handles (file
     * descriptors, sqlite statements) with their release call. std::scope_exit is not available on every toolchain
     * we build with.
     */
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&on_exit) noexcept : _on_exit(std::move(on_exit)) {}

        scope_exit(scope_exit &&other) noexcept : _on_exit(std::move(other._on_exit)), _armed(other._armed) {
            other.release();
        }

        scope_exit(const scope_exit &) = delete;
        scope_exit &operator=(const scope_exit &) = delete;
        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (_armed) _on_exit();
        }

        // The callable will not run
        void release() noexcept { _armed = false; }

    private:
        F _on_exit;
        bool _armed{true};
    };

    template<class F>
    [[nodiscard]] scope_exit<F> make_scope_exit(F &&on_exit) {
        return scope_exit<F>(std::forward<F>(on_exit));
    }

} // namespace valinfo

#endif // VALINFO_SCOPE_H
