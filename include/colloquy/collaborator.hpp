#pragma once
// Collaborator: an optional external dependency
//
// Either Configured (holds a shared handle) or Unconfigured.
// Call sites go through match(), which takes one callable per branch,
// so the unconfigured path can't be forgotten.

#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace colloquy {

struct Unconfigured {};

template<typename T>
class Collaborator {
public:
    Collaborator() : slot_(Unconfigured{}) {}

    // A null handle is Unconfigured
    template<typename U,
             typename = std::enable_if_t<std::is_convertible<U*, T*>::value>>
    Collaborator(std::shared_ptr<U> handle) {
        if (handle) {
            slot_ = std::shared_ptr<T>(std::move(handle));
        } else {
            slot_ = Unconfigured{};
        }
    }

    static Collaborator unconfigured() { return Collaborator(); }

    bool configured() const {
        return std::holds_alternative<std::shared_ptr<T>>(slot_);
    }

    // on_configured(T&) when present, otherwise on_unconfigured().
    // Both callables must return the same type.
    template<typename OnConfigured, typename OnUnconfigured>
    auto match(OnConfigured&& on_configured, OnUnconfigured&& on_unconfigured) const
        -> decltype(on_unconfigured()) {
        if (const auto* handle = std::get_if<std::shared_ptr<T>>(&slot_)) {
            return on_configured(**handle);
        }
        return on_unconfigured();
    }

private:
    std::variant<Unconfigured, std::shared_ptr<T>> slot_;
};

} // namespace colloquy
