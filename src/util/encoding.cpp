#include "util/encoding.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <cstring>
#include <mutex>
#include <sodium.h>
#include <stdexcept>

namespace fdrop::util {

namespace {
void ensureSodiumInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");
    });
}
}

std::string b64_encode(const std::string& data) {
    ensureSodiumInit();

    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

void trimInPlace(std::string& s) { boost::algorithm::trim(s); }

}
