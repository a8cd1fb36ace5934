#pragma once

#include "cJSON.h"
#include "ludo/catalog.hpp"

namespace ludo {

// {"ID":1,"Name":"..","Slug":"..","Description":".."}, caller owns the tree.
cJSON* toJson(const Product& product);

// Array of all products in catalog order, caller owns the tree.
cJSON* toJson(const Catalog& catalog);

}  // namespace ludo
