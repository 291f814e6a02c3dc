////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if XFER__TRACE_ENABLED
#   include <pfs/log.hpp>
#   define XFER__TRACE(t, f, ...) LOGD(t, f , ##__VA_ARGS__)
#else // XFER__TRACE_ENABLED
#   define XFER__TRACE(t, f, ...)
#endif // !XFER__TRACE_ENABLED
