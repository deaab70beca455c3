#pragma once
#include <functional>
#include <tuple>
#include <type_traits>

namespace mediastream::util {

template<typename T, template<typename...> typename Template>
struct is_specialization : std::false_type
{
};

template<template<typename...> typename Template, typename... Args>
struct is_specialization<Template<Args...>, Template> : std::true_type
{
};

template<typename T, template<typename...> typename Template>
constexpr inline bool is_specialization_v = is_specialization<T, Template>::value;

template<typename T>
struct function_traits : function_traits<decltype(&T::operator())>
{
};

template<typename Ret, typename... Args>
struct function_traits<Ret (*)(Args...)>
{
    using return_type = Ret;
    using args_tuple  = std::tuple<Args...>;
};

template<typename Ret, typename... Args>
struct function_traits<std::function<Ret(Args...)>>
{
    using return_type = Ret;
    using args_tuple  = std::tuple<Args...>;
};

template<typename Class, typename Ret, typename... Args>
struct function_traits<Ret (Class::*)(Args...)>
{
    using return_type = Ret;
    using class_type  = Class;
    using args_tuple  = std::tuple<Args...>;
};

template<typename Class, typename Ret, typename... Args>
struct function_traits<Ret (Class::*)(Args...) const>
{
    using return_type = Ret;
    using class_type  = Class;
    using args_tuple  = std::tuple<Args...>;
};

template<typename Func>
using class_type_t = typename function_traits<std::decay_t<Func>>::class_type;

} // namespace mediastream::util
