////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"

XFER__NAMESPACE_BEGIN

constexpr char const * XFER_TAG = "xfer";
constexpr char const * SERVICE_TAG = "xfer/service";

XFER__NAMESPACE_END
