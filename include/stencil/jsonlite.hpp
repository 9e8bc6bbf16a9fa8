#pragma once

#include <string>

namespace stencil::jsonlite {

// Escape a string for embedding between JSON double quotes.
std::string escape(const std::string& s);

}  // namespace stencil::jsonlite
