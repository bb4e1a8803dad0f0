#pragma once

// Lets std::visit take a set of lambdas, one per alternative
template <class... Ts>
struct Overload : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overload(Ts...) -> Overload<Ts...>;
