////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef XFER__STATIC
#   ifndef XFER__EXPORT
#       if _MSC_VER
#           if defined(XFER__EXPORTS)
#               define XFER__EXPORT __declspec(dllexport)
#           else
#               define XFER__EXPORT __declspec(dllimport)
#           endif
#       else
#           define XFER__EXPORT
#       endif
#   endif
#else
#   define XFER__EXPORT
#endif // !XFER__STATIC
