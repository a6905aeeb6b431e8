#pragma once

namespace CloudAnnex {

constexpr const char* VERSION = "0.1.0";

} // namespace CloudAnnex
