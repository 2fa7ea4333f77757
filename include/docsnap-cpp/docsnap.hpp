/// @file docsnap.hpp
/// @brief Umbrella header for the docsnap-cpp library.
///
/// Include this single header for access to all public types:
/// SnapshotEngine, Document, the schemas, the store interfaces and their
/// bundled implementations, the JSON codec, options, logging and Error.

#pragma once

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/change_applicator.hpp>
#include <docsnap-cpp/document.hpp>
#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/file_snapshot_store.hpp>
#include <docsnap-cpp/json.hpp>
#include <docsnap-cpp/log.hpp>
#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/op.hpp>
#include <docsnap-cpp/options.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/snapshot.hpp>
#include <docsnap-cpp/snapshot_engine.hpp>
#include <docsnap-cpp/stores.hpp>
#include <docsnap-cpp/types.hpp>
#include <docsnap-cpp/value.hpp>
