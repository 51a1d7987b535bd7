#pragma once

#include "core/bit_packer.hpp"
#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/uuid.hpp"
#include "generation/generator.hpp"
#include "generation/legacy.hpp"

namespace chronoid {

using generation::Generator;
using generation::GeneratorState;
using generation::default_generator;

using generation::generate_v1;
using generation::generate_v3;
using generation::generate_v4;
using generation::generate_v5;
using generation::generate_v6;
using generation::generate_v7;
using generation::generate_v8;

using generation::NAMESPACE_DNS;
using generation::NAMESPACE_OID;
using generation::NAMESPACE_URL;
using generation::NAMESPACE_X500;

} // namespace chronoid
