#pragma once

template <class... Func>
struct overloaded : Func... {
    using Func::operator()...;
};

template <class... Func>
overloaded(Func...) -> overloaded<Func...>;
