//===----------------------------------------------------------------------===//
//                         IOM Client
//
// transfer/stream_pump.hpp
//
// Bounded-buffer drain loop shared by log, listing and file retrieval
//===----------------------------------------------------------------------===//

#pragma once

#include "broker/broker.hpp"
#include <functional>
#include <string>

namespace iomclient {

// Reads up to n bytes; returns an empty string at end of stream
using ChunkReader = std::function<std::string(size_t)>;

// Call `read_chunk(chunk_size)` until it yields an empty chunk and return
// the concatenation of everything read before that.
std::string Drain(const ChunkReader& read_chunk, size_t chunk_size);

// Drain a binary stream to exhaustion. The stream is not closed.
std::string DrainStream(broker::BinaryStream& stream, size_t chunk_size);

} // namespace iomclient
