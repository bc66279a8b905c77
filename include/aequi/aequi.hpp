#ifndef AEQUI_AEQUI_HPP
#define AEQUI_AEQUI_HPP

// Umbrella header

#include "types.hpp"
#include "hex.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "host.hpp"
#include "ledger.hpp"
#include "erc20.hpp"
#include "token.hpp"
#include "registry.hpp"
#include "injector.hpp"
#include "batch_codec.hpp"
#include "executor.hpp"
#include "config.hpp"

namespace aequi {

constexpr const char* VERSION = "1.0.0";

} // namespace aequi

#endif // AEQUI_AEQUI_HPP
