#pragma once

#include "merkle/builder.hpp"
#include "merkle/codec.hpp"
#include "merkle/common.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/log.hpp"
#include "merkle/proof.hpp"
#include "merkle/tree.hpp"
#include "merkle/verifier.hpp"
