#pragma once

#include <tuple>
#include <utility>

#include "sender.hpp"

namespace tick::execution {

// [exec.factories.just], completes inline with the given values
template <class... Vs>
struct _just_sender {
  using sender_concept = sender_t;
  using value_types    = type_list<Vs...>;

  std::tuple<Vs...> values_;

  template <receiver R>
  auto connect(R&& r) && {
    return _operation<__remove_cvref_t<R>>{std::move(values_), std::forward<R>(r)};
  }

  template <receiver R>
  auto connect(R&& r) const& {
    return _operation<__remove_cvref_t<R>>{values_, std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    std::tuple<Vs...> values_;
    Rcvr              receiver_;

    void start() & noexcept {
      std::apply(
          [this](auto&&... args) -> auto {
            std::move(receiver_).set_value(std::forward<decltype(args)>(args)...);
          },
          std::move(values_));
    }
  };
};

struct just_t {
  template <class... Vs>
  constexpr auto operator()(Vs&&... vs) const {
    return _just_sender<__decay_t<Vs>...>{std::tuple<__decay_t<Vs>...>{std::forward<Vs>(vs)...}};
  }
};

inline constexpr just_t just{};

}  // namespace tick::execution
