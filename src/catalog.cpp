#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "ludo/catalog.hpp"

namespace ludo {

Catalog::Catalog(std::vector<Product> products) : products_(std::move(products)) {
    std::unordered_set<std::string> slugs;
    for (const auto& product : products_) {
        if (product.slug_.empty()) {
            throw std::invalid_argument("product " + std::to_string(product.id_) +
                                        " has an empty slug");
        }
        if (!slugs.insert(product.slug_).second) {
            throw std::invalid_argument("duplicate slug: " + product.slug_);
        }
    }
}

Catalog Catalog::boardGames() {
    return Catalog({
        {1,
         "Cards Against Humanity",
         "cah",
         "Cards Against Humanity is a party game for horrible people."},
        {2,
         "Space Team",
         "space-team",
         "A fast-paced, shouting card game where you work together as a team to repair a "
         "busted spaceship."},
        {3,
         "Sonar",
         "sonar",
         "You and your teammates control a state-of-the-art submarine and are trying to locate "
         "an enemy submarine in order to blow it out of the water before they can do the same "
         "to you."},
        {4,
         "Codenames",
         "codenames",
         "In Codenames, two teams compete to see who can make contact with all of their agents "
         "first."},
        {5,
         "Dixit",
         "dixit",
         "Every picture tells a story - but what story will your picture tell? Dixit is the "
         "lovingly illustrated game of creative guesswork, where your imagination unlocks the "
         "tale."},
        {6,
         "Ticket To Ride",
         "ticket-to-ride",
         "Ticket to Ride is a cross-country train adventure where players collect cards of "
         "various types of train cars that enable them to claim railway routes connecting "
         "cities in various countries around the world."},
    });
}

const Product* Catalog::findBySlug(const std::string& slug) const {
    for (const auto& product : products_) {
        if (product.slug_ == slug) {
            return &product;
        }
    }
    return nullptr;
}

}  // namespace ludo
