/**
 * @file file_record.hpp
 * @brief FileRecord state machine rules and staging-area naming
 *
 * @details Pure functions, no locking and no filesystem access:
 *
 *          - FileState <-> persisted string conversion
 *
 *          - Allowed state transitions
 *
 *          - Deterministic staging and destination file names
 */

#ifndef NET_STAGE_FILE_RECORD_HPP
#define NET_STAGE_FILE_RECORD_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace net_stage {

// **---- State Names ----**

/**
 * @brief Persisted name of a state ("pending", "downloading", ...).
 */
const char *to_string(FileState state);

/**
 * @brief Parse a persisted state name.
 * @return The state, or std::nullopt for an unknown name
 */
std::optional<FileState> parse_file_state(const std::string &name);

/**
 * @brief true for COMPLETE and FAILED.
 */
bool is_terminal(FileState state);

// **---- Transitions ----**

/**
 * @brief Check whether the pipeline may move a record from one state to
 *        another.
 *
 * @note Happy path: PENDING -> DOWNLOADING -> LOCAL -> ENCODING -> UPLOADING
 *       -> COMPLETE. Every non-terminal state may also go to FAILED.
 *       Terminal states accept nothing. Resume rewinds do not go through
 *       this check.
 */
bool can_transition(FileState from, FileState to);

/**
 * @brief Count records per state.
 */
ProgressSnapshot summarize(const std::vector<FileRecord> &records);

// **---- Naming ----**

/**
 * @brief Staging file name for the downloaded copy of a source.
 * @param source_path Original path
 * @param collision_index 0 for the plain name, N > 0 appends "_N" to the stem
 * @return e.g. "download_movie.mkv" or "download_movie_1.mkv"
 */
std::string download_name(const std::string &source_path,
                          int collision_index = 0);

/**
 * @brief Staging file name for the encoded output of a local copy.
 * @note Built from the whole local file name, extension included, so it is
 *       unique whenever the local name is.
 * @return e.g. "encoded_download_movie.mkv.mp4"
 */
std::string encoded_name(const std::string &local_path,
                         const std::string &output_extension);

/**
 * @brief Destination of the encoded file next to its source.
 *
 * @param source_path Original path
 * @param output_extension Extension of the encoded file, with the dot
 * @param replace_original true: same stem, new extension;
 *                         false: "<stem>_reencoded<ext>"
 */
std::string compute_final_path(const std::string &source_path,
                               const std::string &output_extension,
                               bool replace_original);

} // namespace net_stage

#endif // NET_STAGE_FILE_RECORD_HPP
