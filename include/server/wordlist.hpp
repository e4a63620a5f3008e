#pragma once

#include <span>
#include <string_view>

namespace xfer {

std::span<const std::string_view> WordList();

} // namespace xfer
