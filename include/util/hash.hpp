#pragma once

#include <string>

namespace tandem::util {

std::string sha256Hex(const std::string& data);

}
