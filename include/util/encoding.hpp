#pragma once

#include <string>

namespace fdrop::util {

std::string b64_encode(const std::string& data);

void trimInPlace(std::string& s);

}
