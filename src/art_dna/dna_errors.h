// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_ERRORS_H
#define ARTDNA_DNA_ERRORS_H

/**
 * Error taxonomy for the DNA engine.
 *
 *   InvalidInput       - empty or degenerate input (empty stroke, bad canvas size)
 *   DimensionMismatch  - vector lengths disagree in distance or blend
 *   BackendUnavailable - storage not initialized, or I/O failure
 *   WorkerFailure      - background task rejected or worker crashed
 *
 * Programming errors (calling a cold-path encoder synchronously) are
 * reported with std::logic_error instead.
 */

#include <util/error_format.h>

#include <stdexcept>
#include <string>

namespace art_dna {

/** Built from CErrorFormatter::InputError so the log code travels with it */
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const ErrorMessage& error)
        : std::runtime_error(error.description), m_code(error.error_code) {}

    const std::string& code() const { return m_code; }

private:
    std::string m_code;
};

class DimensionMismatch : public std::runtime_error {
public:
    explicit DimensionMismatch(const std::string& what) : std::runtime_error(what) {}
    DimensionMismatch(size_t expected, size_t actual)
        : std::runtime_error("Vector length mismatch: " + std::to_string(expected) +
                             " vs " + std::to_string(actual)) {}
};

class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class WorkerFailure : public std::runtime_error {
public:
    explicit WorkerFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace art_dna

#endif // ARTDNA_DNA_ERRORS_H
