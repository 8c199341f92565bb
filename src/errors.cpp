#include "parafetch/errors.hpp"

#include <fmt/format.h>

namespace parafetch {

HttpStatusError::HttpStatusError(long status)
    : TransportError(fmt::format("HTTP error {}", status)), status_(status) {}

} // namespace parafetch
