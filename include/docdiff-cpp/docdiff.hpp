/// @file docdiff.hpp
/// @brief Umbrella header for the docdiff-cpp library.
///
/// Include this single header for access to all public types and
/// operations: Value, Change, DiffOptions, compute_diff, apply_change,
/// the version chain, the wire and record codecs, DocumentUpdater,
/// and DiffException.

#pragma once

#include <docdiff-cpp/apply.hpp>
#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/diff.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/json.hpp>
#include <docdiff-cpp/logging.hpp>
#include <docdiff-cpp/normalize.hpp>
#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/path.hpp>
#include <docdiff-cpp/record_codec.hpp>
#include <docdiff-cpp/updater.hpp>
#include <docdiff-cpp/value.hpp>
#include <docdiff-cpp/version_chain.hpp>
