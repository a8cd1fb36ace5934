#pragma once

#include <string>

namespace ludo {

struct Header {
    std::string name_;
    std::string value_;
};

}  // namespace ludo
