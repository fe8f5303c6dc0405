// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// Define MANAGED_CONTAINERS_NO_ALLOC before including any header of this
// library to build for targets without a heap. The owned (heap-backed)
// alternatives of managed_map and managed_slice are then compiled out and
// only the borrowed, fixed-capacity storage remains.
#ifdef MANAGED_CONTAINERS_NO_ALLOC
#define MANAGED_CONTAINERS_HAS_ALLOC 0
#else
#define MANAGED_CONTAINERS_HAS_ALLOC 1
#endif
