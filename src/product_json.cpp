#include "ludo/product_json.hpp"

namespace ludo {

cJSON* toJson(const Product& product) {
    cJSON* obj = cJSON_CreateObject();
    if (obj == nullptr) {
        return nullptr;
    }
    cJSON_AddNumberToObject(obj, "ID", product.id_);
    cJSON_AddStringToObject(obj, "Name", product.name_.c_str());
    cJSON_AddStringToObject(obj, "Slug", product.slug_.c_str());
    cJSON_AddStringToObject(obj, "Description", product.description_.c_str());
    return obj;
}

cJSON* toJson(const Catalog& catalog) {
    cJSON* array = cJSON_CreateArray();
    if (array == nullptr) {
        return nullptr;
    }
    for (const auto& product : catalog.products()) {
        cJSON* item = toJson(product);
        if (item == nullptr) {
            cJSON_Delete(array);
            return nullptr;
        }
        cJSON_AddItemToArray(array, item);
    }
    return array;
}

}  // namespace ludo
