/// @file change_applicator.hpp
/// @brief Replays changes onto a document instance.

#pragma once

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/document.hpp>

#include <span>

namespace docsnap_cpp {

/// Apply `changes` to `doc`: every change in the given order, and every
/// operation of a change in the order it was recorded.
///
/// Errors raised by the document propagate unchanged; operations applied
/// before a failing one stay applied.
void apply_changes(Document& doc, std::span<const Change> changes);

}  // namespace docsnap_cpp
