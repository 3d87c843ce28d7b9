//===----------------------------------------------------------------------===//
//                         IOM Client
//
// transfer/stream_pump.cpp
//
// Stream pump implementation
//===----------------------------------------------------------------------===//

#include "transfer/stream_pump.hpp"
#include <stdexcept>

namespace iomclient {

std::string Drain(const ChunkReader& read_chunk, size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Drain chunk size must be greater than 0");
    }

    std::string result;
    while (true) {
        std::string chunk = read_chunk(chunk_size);
        if (chunk.empty()) {
            break;
        }
        result += chunk;
    }
    return result;
}

std::string DrainStream(broker::BinaryStream& stream, size_t chunk_size) {
    return Drain([&stream](size_t n) { return stream.Read(n); }, chunk_size);
}

} // namespace iomclient
