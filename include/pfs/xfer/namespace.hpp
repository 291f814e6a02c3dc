////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef XFER__NAMESPACE_NAME
#   define XFER__NAMESPACE_NAME xfer
#   define XFER__NAMESPACE_BEGIN namespace XFER__NAMESPACE_NAME {
#   define XFER__NAMESPACE_END }
#endif
