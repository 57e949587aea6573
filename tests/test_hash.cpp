#include "test_common.h"

#include "warden/hash.h"

using namespace warden::hash;

int main() {
    // FIPS 180-2 vectors
    expect_eq_str(sha256_hex(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty");
    expect_eq_str(sha256_hex("abc"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc");
    expect_eq_str(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
                  "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1", "two-block message");

    // Streaming in odd-sized pieces matches one-shot hashing.
    std::string big;
    for (int i = 0; i < 1000; i++) big += "line " + std::to_string(i) + "\n";
    Sha256 h;
    for (size_t off = 0; off < big.size(); off += 37) h.update(big.substr(off, 37));
    expect_eq_str(h.finish_hex(), sha256_hex(big), "streamed == one-shot");

    expect_true(constant_time_eq("abc", "abc"), "equal strings");
    expect_true(!constant_time_eq("abc", "abd"), "different strings");
    expect_true(!constant_time_eq("abc", "abcd"), "different lengths");

    std::cerr << "test_hash: ALL PASSED" << std::endl;
    return 0;
}
