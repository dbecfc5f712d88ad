#pragma once

/// Umbrella header for the mcpparse JSON-RPC decoding library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "json_tree.hpp"
#include "decoder.hpp"
#include "codec.hpp"
