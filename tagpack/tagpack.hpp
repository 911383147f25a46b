#pragma once

#include "tagpack/codec.hpp"
#include "tagpack/decoder.hpp"
#include "tagpack/encoder.hpp"
#include "tagpack/errors.hpp"
#include "tagpack/logger.hpp"
#include "tagpack/options.hpp"
#include "tagpack/rpc_codec.hpp"
#include "tagpack/traits.hpp"
#include "tagpack/types.hpp"
#include "tagpack/value.hpp"
#include "tagpack/wire.hpp"
