#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace warden::hash {

// ---------- SHA-256 ----------
// Purpose: audit line checksums and snapshot tree digests.
// Streaming form so large workspace files can be hashed without slurping.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes; the object must not be updated afterwards.
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::array<uint8_t, 32> sha256_bytes(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

std::string to_hex(const uint8_t* data, size_t n);

// Constant-time string equality (for comparing hex checksums)
bool constant_time_eq(const std::string& a, const std::string& b);

} // namespace warden::hash
