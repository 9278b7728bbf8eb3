#pragma once

#if defined(_WIN32)
#  if defined(FEDLINK_BUILD_SHARED)
#    if defined(fedlink_core_EXPORTS)
#      define FEDLINK_API __declspec(dllexport)
#    else
#      define FEDLINK_API __declspec(dllimport)
#    endif
#  else
#    define FEDLINK_API
#  endif
#else
#  if defined(FEDLINK_BUILD_SHARED)
#    define FEDLINK_API __attribute__((visibility("default")))
#  else
#    define FEDLINK_API
#  endif
#endif
