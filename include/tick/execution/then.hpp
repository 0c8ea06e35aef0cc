#pragma once

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "sender.hpp"

namespace tick::execution {

namespace _then_detail {

// Result of invoking F with the values a sender completes with
template <class F, class TypeList>
struct _invoke_result;

template <class F, class... Ts>
struct _invoke_result<F, type_list<Ts...>> {
  using type = std::invoke_result_t<F, Ts...>;
};

// Wrap result in type_list, but handle void specially
template <class T>
struct _wrap_in_type_list {
  using type = type_list<T>;
};

template <>
struct _wrap_in_type_list<void> {
  using type = type_list<>;
};

template <class S, class F>
using value_types_t = typename _wrap_in_type_list<
    typename _invoke_result<F, typename __remove_cvref_t<S>::value_types>::type>::type;

}  // namespace _then_detail

// [exec.adaptors.then], then adaptor
template <sender S, class F>
struct _then_sender {
  using sender_concept = sender_t;
  using value_types    = _then_detail::value_types_t<S, F>;

  S sender_;
  F fun_;

  template <receiver R>
  auto connect(R&& r) && {
    return std::move(sender_).connect(
        _then_receiver<F, __remove_cvref_t<R>>{std::move(fun_), std::forward<R>(r)});
  }

  template <receiver R>
  auto connect(R&& r) const& {
    return sender_.connect(_then_receiver<F, __remove_cvref_t<R>>{fun_, std::forward<R>(r)});
  }

 private:
  template <class Fn, class Rcvr>
  struct _then_receiver {
    using receiver_concept = receiver_t;

    Fn   fun_;
    Rcvr receiver_;

    template <class... Args>
    void set_value(Args&&... args) && noexcept {
      try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, Args...>>) {
          std::invoke(std::move(fun_), std::forward<Args>(args)...);
          std::move(receiver_).set_value();
        } else {
          std::move(receiver_).set_value(std::invoke(std::move(fun_), std::forward<Args>(args)...));
        }
      } catch (...) {
        std::move(receiver_).set_error(std::current_exception());
      }
    }

    template <class E>
    void set_error(E&& e) && noexcept {
      std::move(receiver_).set_error(std::forward<E>(e));
    }

    void set_stopped() && noexcept {
      std::move(receiver_).set_stopped();
    }
  };
};

template <class F>
struct _pipeable_then;

struct then_t {
  template <sender S, class F>
  constexpr auto operator()(S&& s, F&& f) const {
    return _then_sender<__decay_t<S>, __decay_t<F>>{std::forward<S>(s), std::forward<F>(f)};
  }

  // Curried call for pipe syntax
  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_then<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr then_t then{};

template <class F>
struct _pipeable_then {
  F fun_;

  template <sender S>
  friend auto operator|(S&& s, _pipeable_then p) {
    return then_t{}(std::forward<S>(s), std::move(p.fun_));
  }
};

}  // namespace tick::execution
