#pragma once

#include <string>
#include <vector>

namespace ludo {

struct Product {
    int id_;
    std::string name_;
    std::string slug_;
    std::string description_;
};

// Fixed, ordered set of products. Built once and never changed afterwards, so
// it may be shared between threads without locking.
class Catalog {
   public:
    // Throws std::invalid_argument on an empty or duplicated slug.
    explicit Catalog(std::vector<Product> products);

    // The six board games served by ludo_server.
    static Catalog boardGames();

    const std::vector<Product>& products() const {
        return products_;
    }

    // nullptr when no product has the slug.
    const Product* findBySlug(const std::string& slug) const;

    size_t size() const {
        return products_.size();
    }

   private:
    std::vector<Product> products_;
};

}  // namespace ludo
