#pragma once

#if defined(_WIN32)
#  if defined(LANSHARE_BUILD_SHARED)
#    if defined(lanshare_core_EXPORTS)
#      define LANSHARE_API __declspec(dllexport)
#    else
#      define LANSHARE_API __declspec(dllimport)
#    endif
#  else
#    define LANSHARE_API
#  endif
#else
#  if defined(LANSHARE_BUILD_SHARED)
#    define LANSHARE_API __attribute__((visibility("default")))
#  else
#    define LANSHARE_API
#  endif
#endif
