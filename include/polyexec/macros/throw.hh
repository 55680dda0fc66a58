#pragma once

#include <polyexec/concat_tostr.hh>
#include <polyexec/macros/stringify.hh>
#include <stdexcept>

// Includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )

// Like THROW() but throws @p exception_type
#define THROW_AS(exception_type, ...)                                                  \
    throw exception_type(                                                              \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
