#pragma once

#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <cstdlib>
#include <string>

namespace base
{
// Called when CHECK failed.
// If returns true then crash application.
using AssertFailedFn = bool (*)(SrcPoint const &, std::string const &);
extern AssertFailedFn OnAssertFailed;

/// @return Old handler.
AssertFailedFn SetAssertFunction(AssertFailedFn fn);
}  // namespace base

#define ASSERT_CRASH() std::abort()

#define ASSERT_FAIL(msg)                          \
  if (::base::OnAssertFailed(SRC(), msg))         \
    ASSERT_CRASH();

#define CHECK(X, msg)                                            \
  do                                                             \
  {                                                              \
    if (X)                                                       \
    {                                                            \
    }                                                            \
    else                                                         \
    {                                                            \
      ASSERT_FAIL(::base::Message("CHECK(" #X ")", ::base::Message msg)); \
    }                                                            \
  } while (false)

#define CHECK_EQUAL(X, Y, msg)                                                        \
  do                                                                                  \
  {                                                                                   \
    if ((X) == (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ASSERT_FAIL(::base::Message("CHECK(" #X " == " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                 \
  } while (false)

#define CHECK_NOT_EQUAL(X, Y, msg)                                                    \
  do                                                                                  \
  {                                                                                   \
    if ((X) != (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ASSERT_FAIL(::base::Message("CHECK(" #X " != " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                 \
  } while (false)

#define CHECK_LESS(X, Y, msg)                                                        \
  do                                                                                 \
  {                                                                                  \
    if ((X) < (Y))                                                                   \
    {                                                                                \
    }                                                                                \
    else                                                                             \
    {                                                                                \
      ASSERT_FAIL(::base::Message("CHECK(" #X " < " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                \
  } while (false)

#define CHECK_LESS_OR_EQUAL(X, Y, msg)                                                \
  do                                                                                  \
  {                                                                                   \
    if ((X) <= (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ASSERT_FAIL(::base::Message("CHECK(" #X " <= " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                 \
  } while (false)

#define CHECK_GREATER(X, Y, msg)                                                     \
  do                                                                                 \
  {                                                                                  \
    if ((X) > (Y))                                                                   \
    {                                                                                \
    }                                                                                \
    else                                                                             \
    {                                                                                \
      ASSERT_FAIL(::base::Message("CHECK(" #X " > " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                \
  } while (false)

#define CHECK_GREATER_OR_EQUAL(X, Y, msg)                                             \
  do                                                                                  \
  {                                                                                   \
    if ((X) >= (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ASSERT_FAIL(::base::Message("CHECK(" #X " >= " #Y ")", X, Y, ::base::Message msg)); \
    }                                                                                 \
  } while (false)
