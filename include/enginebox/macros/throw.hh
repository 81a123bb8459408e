#pragma once

#include "enginebox/concat_tostr.hh"

#include <stdexcept>

#define THROW(...)                                                                  \
    throw std::runtime_error(concat_tostr(__FILE__ ":", __LINE__, ": ", __VA_ARGS__))
