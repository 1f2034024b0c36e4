#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace llvmsel {

// ============================================================================
// Source Locations
// ============================================================================
//
// A source location is either an HTTP(S) mirror base URL or a local
// directory given as file:<path>. Both use the <version>/<filename> layout.

enum class LocationType {
    Http,
    File,
    Invalid
};

struct ParsedLocation {
    LocationType type = LocationType::Invalid;
    std::string base;   // URL or directory, without the file: prefix
    std::string error;
};

ParsedLocation parse_source_location(const std::string& location);

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);

// Hash a file in fixed-size chunks
HashResult compute_file_sha256(const std::string& path);

// Checksum manifest in sha256sum format: "<hex>  <filename>" per line.
// Keys are filenames, values lowercase digests.
struct ChecksumManifest {
    bool ok = false;
    std::string error;
    std::map<std::string, std::string> digests;
};

ChecksumManifest parse_checksum_manifest(const std::string& content);

// ============================================================================
// Fetching
// ============================================================================

// Archives are streamed to disk and hashed on the way, never held in memory
struct FetchResult {
    bool ok = false;
    std::string error;
    std::string sha256;   // lowercase hex digest of the bytes written
    uint64_t bytes = 0;
    long http_status = 0;
};

// Download an HTTP(S) URL into `dest`, following redirects
FetchResult download_to_file(const std::string& url, const std::string& dest);

// Copy a local file into `dest`
FetchResult copy_local_file(const std::string& source, const std::string& dest);

} // namespace llvmsel
