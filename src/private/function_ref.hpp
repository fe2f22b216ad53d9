#pragma once

#include <type_traits>
#include <utility>

namespace bkregex {
// Non-owning reference to a callable. Only valid while the referenced
// callable is alive, so it should only ever be used as a parameter.
template <typename Signature> class FunctionRef;

template <typename Result, typename... Args>
class FunctionRef<Result(Args...)> {
  void const *m_callable;
  Result (*m_invoke)(void const *, Args...);

public:
  template <typename Callable>
    requires(not std::is_same_v<std::remove_cvref_t<Callable>, FunctionRef> &&
             std::is_invocable_r_v<Result, Callable const &, Args...>)
  constexpr FunctionRef(Callable const &callable)
      : m_callable{&callable},
        m_invoke{[](void const *erased, Args... args) -> Result {
          return (*static_cast<Callable const *>(erased))(
              std::forward<Args>(args)...);
        }} {}

  constexpr auto operator()(Args... args) const -> Result {
    return m_invoke(m_callable, std::forward<Args>(args)...);
  }
};
} // namespace bkregex
