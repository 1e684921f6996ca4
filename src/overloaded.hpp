#pragma once

// Internal helper: build a std::visit visitor from a set of lambdas.
// This header is NOT installed.

namespace libctdi::internal {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace libctdi::internal
