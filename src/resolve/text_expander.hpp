#pragma once

#include <string>
#include "core/config/upload_settings.hpp"

namespace uploader::resolve {

// Substitutes ${NAME}, $NAME and %NAME% from env. Unknown names stay verbatim.
std::string expand_text(const std::string& text, const core::config::Environment& env);

}  // namespace uploader::resolve
