// Fuzz target for GETBLOCKHEADERS decoding
// Any input must either be rejected or decode into a request that re-encodes
// to exactly the same bytes

#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace headerpipe::message;

    GetBlockHeadersMessage msg;
    if (!msg.deserialize(data, size)) {
        return 0;
    }

    // Accepted requests never exceed the per-response cap
    if (msg.limit > headerpipe::protocol::MAX_HEADERS_PER_REQUEST) {
        __builtin_trap();
    }

    // Decoding rejects non-canonical varints, trailing bytes and bools > 1,
    // so an accepted input is its own canonical encoding
    std::vector<uint8_t> encoded = msg.serialize();
    if (encoded.size() != size || std::memcmp(encoded.data(), data, size) != 0) {
        __builtin_trap();
    }

    GetBlockHeadersMessage again;
    if (!again.deserialize(encoded.data(), encoded.size())) {
        __builtin_trap();
    }
    if (again.request_id != msg.request_id || !(again.start_block == msg.start_block) ||
        again.limit != msg.limit || again.skip != msg.skip || again.reverse != msg.reverse) {
        __builtin_trap();
    }

    return 0;
}
