#pragma once
#include <cstddef>

// Define program metadata constants
constexpr const char* PROGRAM_NAME = "Record Linkage Matcher";
constexpr const char* PROGRAM_VERSION = "V 1.0.0";

// Default file names
constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
constexpr const char* LOG_FILE = "rl_matcher.log";

// Shard names written to the output directory
constexpr const char* GROUND_TRUTH_SHARD = "temp_match_gid.csv";
constexpr const char* BATCH_SHARD_PREFIX = "temp_match_";

// Chunk size used for passes without a configured one
constexpr std::size_t DEFAULT_CHUNK_SIZE = 100000;

// Name of the ordinal index column generated in staged record tables
constexpr const char* ORDINAL_COLUMN = "idx";

// Logical field holding the caller-supplied record identifier
constexpr const char* IDENTIFIER_FIELD = "indv_id";

// Marker on blocking variables that reverses side B's variable order
constexpr const char* INVERTED_MARKER = "_inv";
