#include "llvmsel/download.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <curl/curl.h>
#include <openssl/evp.h>

namespace llvmsel {

// ============================================================================
// Source Locations
// ============================================================================

ParsedLocation parse_source_location(const std::string& location) {
    ParsedLocation result;

    if (location.empty()) {
        result.error = "empty source location";
        return result;
    }

    if (location.rfind("file:", 0) == 0) {
        result.base = location.substr(5);
        if (result.base.empty()) {
            result.error = "empty file path";
            return result;
        }
        result.type = LocationType::File;
        return result;
    }

    if (location.rfind("https://", 0) == 0 || location.rfind("http://", 0) == 0) {
        result.type = LocationType::Http;
        result.base = location;
        return result;
    }

    result.error = "unsupported source location, expected file:, http:// or https://";
    return result;
}

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Incremental SHA-256; the first failing EVP call sticks
class Sha256Stream {
public:
    Sha256Stream() {
        if (!ctx_) {
            error_ = "EVP_MD_CTX_new failed";
        } else if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error_ = "EVP_DigestInit_ex failed";
        }
    }

    bool update(const void* data, size_t len) {
        if (!error_.empty()) return false;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            error_ = "EVP_DigestUpdate failed";
            return false;
        }
        return true;
    }

    HashResult finish() {
        HashResult result;
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
            result.error = "EVP_DigestFinal_ex failed";
            return result;
        }

        result.hex_digest = bytes_to_hex(hash, hash_len);
        result.ok = true;
        return result;
    }

private:
    EvpMdCtx ctx_;
    std::string error_;
};

constexpr size_t kChunkSize = 64 * 1024;

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    Sha256Stream hash;
    hash.update(data.data(), data.size());
    return hash.finish();
}

HashResult compute_file_sha256(const std::string& path) {
    HashResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open " + path;
        return result;
    }

    Sha256Stream hash;
    std::vector<char> chunk(kChunkSize);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        hash.update(chunk.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        result.error = "failed to read " + path;
        return result;
    }

    return hash.finish();
}

ChecksumManifest parse_checksum_manifest(const std::string& content) {
    ChecksumManifest result;

    std::istringstream ss(content);
    std::string line;
    int line_no = 0;
    while (std::getline(ss, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        auto space = line.find(' ');
        if (space == std::string::npos) {
            result.error = "line " + std::to_string(line_no) + ": expected '<sha256>  <filename>'";
            return result;
        }

        std::string digest = to_lower(line.substr(0, space));
        std::string name = line.substr(space + 1);
        // sha256sum marks binary mode with '*' and separates with two spaces
        while (!name.empty() && (name[0] == ' ' || name[0] == '*')) {
            name.erase(name.begin());
        }

        bool hex = digest.size() == 64 &&
                   std::all_of(digest.begin(), digest.end(),
                               [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (!hex || name.empty()) {
            result.error = "line " + std::to_string(line_no) + ": malformed checksum entry";
            return result;
        }

        result.digests[name] = digest;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// HTTP Fetching with libcurl
// ============================================================================

namespace {

// Destination file plus the running digest of everything written to it
struct ArchiveSink {
    std::ofstream out;
    Sha256Stream hash;
    uint64_t bytes = 0;

    bool write(const char* data, size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        if (!out.good() || !hash.update(data, len)) {
            return false;
        }
        bytes += len;
        return true;
    }

    // Closes the file and fills in sha256 and bytes; false if anything failed
    bool finish(FetchResult& result, const std::string& dest) {
        out.close();
        if (out.fail()) {
            result.error = "failed to write " + dest;
            return false;
        }
        auto digest = hash.finish();
        if (!digest.ok) {
            result.error = digest.error;
            return false;
        }
        result.sha256 = digest.hex_digest;
        result.bytes = bytes;
        return true;
    }
};

size_t write_to_sink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<ArchiveSink*>(userdata);
    size_t total = size * nmemb;
    // Anything short of `total` makes curl abort with CURLE_WRITE_ERROR
    return sink->write(ptr, total) ? total : 0;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

FetchResult download_to_file(const std::string& url, const std::string& dest) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    ArchiveSink sink;
    sink.out.open(dest, std::ios::binary | std::ios::trunc);
    if (!sink.out) {
        result.error = "failed to create " + dest;
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_sink);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    // Release tarballs run to hundreds of megabytes
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 1800L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "llvm-select/" LLVMSEL_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    if (res == CURLE_HTTP_RETURNED_ERROR) {
        result.error = "HTTP " + std::to_string(result.http_status) + " for " + url;
        return result;
    }
    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                      (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    if (!sink.finish(result, dest)) {
        return result;
    }

    result.ok = true;
    return result;
}

FetchResult copy_local_file(const std::string& source, const std::string& dest) {
    FetchResult result;

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        result.error = "failed to open " + source;
        return result;
    }

    ArchiveSink sink;
    sink.out.open(dest, std::ios::binary | std::ios::trunc);
    if (!sink.out) {
        result.error = "failed to create " + dest;
        return result;
    }

    std::vector<char> chunk(kChunkSize);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto count = static_cast<size_t>(in.gcount());
        if (count > 0 && !sink.write(chunk.data(), count)) {
            result.error = "failed to write " + dest;
            return result;
        }
    }
    if (in.bad()) {
        result.error = "failed to read " + source;
        return result;
    }

    if (!sink.finish(result, dest)) {
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace llvmsel
