#ifndef AEQUI_BATCH_CODEC_HPP
#define AEQUI_BATCH_CODEC_HPP

#include <vector>

#include "types.hpp"

namespace aequi {

// execute((address,uint256)[],(address,address,uint256,bool)[],
//         (address,uint256,bytes,address,uint256)[],address[])
constexpr Selector EXECUTE_SELECTOR = 0x05825102;

// Calldata for execute(). Throws abi::AbiError on malformed input.
Bytes encode_execute(const Batch& batch);
Batch decode_execute(const Bytes& calldata);

// bytes[] return data of execute()
Bytes encode_results(const std::vector<Bytes>& results);
std::vector<Bytes> decode_results(const Bytes& output);

} // namespace aequi

#endif // AEQUI_BATCH_CODEC_HPP
