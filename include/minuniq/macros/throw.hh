#pragma once

#include "minuniq/concat_tostr.hh"

#include <stdexcept>

#define MINUNIQ_STRINGIZE_IMPL(x) #x
#define MINUNIQ_STRINGIZE(x) MINUNIQ_STRINGIZE_IMPL(x)

// Throws std::runtime_error with the concatenation of the arguments and the throw site
#define THROW(...)                          \
    throw std::runtime_error(concat_tostr( \
        __VA_ARGS__, " (thrown at " __FILE__ ":" MINUNIQ_STRINGIZE(__LINE__) ")"))
