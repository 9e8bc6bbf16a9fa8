#pragma once

// Umbrella header.

#include "stencil/buffered_file.hpp"
#include "stencil/config.hpp"
#include "stencil/hash.hpp"
#include "stencil/joined_file.hpp"
#include "stencil/observability.hpp"
#include "stencil/raw_view.hpp"
#include "stencil/source.hpp"
#include "stencil/stencil_table.hpp"
#include "stencil/types.hpp"
