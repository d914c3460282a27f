/// @file jsontree.hpp
/// @brief Umbrella header for the jsontree-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Object, Array, Pointer, DiffRecord, PatchOperation, Error,
/// and the nlohmann/json codec.

#pragma once

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/error.hpp>
#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/logging.hpp>
#include <jsontree-cpp/patch.hpp>
#include <jsontree-cpp/pointer.hpp>
#include <jsontree-cpp/value.hpp>
