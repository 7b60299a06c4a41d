#pragma once

#include <string>

namespace ocrflow_core {

// Random (version 4) UUID in canonical 8-4-4-4-12 form, from OpenSSL's CSPRNG.
std::string generate_uuid();

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(const std::string &content);

// Job ids supplied by clients must be 8-64 chars of [A-Za-z0-9-].
bool is_valid_job_id(const std::string &job_id);

}  // namespace ocrflow_core
