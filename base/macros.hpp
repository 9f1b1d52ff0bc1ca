#pragma once

#define DISALLOW_COPY(className)                  \
  className(className const &) = delete;          \
  className & operator=(className const &) = delete

#define DISALLOW_MOVE(className)             \
  className(className &&) = delete;          \
  className & operator=(className &&) = delete

#define DISALLOW_COPY_AND_MOVE(className) \
  DISALLOW_COPY(className);               \
  DISALLOW_MOVE(className)

#define UNUSED_VALUE(x) static_cast<void>(x)

#define TO_STRING_IMPL(x) #x
#define TO_STRING(x) TO_STRING_IMPL(x)
