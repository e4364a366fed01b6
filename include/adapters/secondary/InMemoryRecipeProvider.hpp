#pragma once

#include "ports/output/IRecipeProvider.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace inventory::adapters::secondary {

/**
 * @brief Техкарты в памяти (заполняются через setRecipe)
 */
class InMemoryRecipeProvider : public ports::output::IRecipeProvider {
public:
    std::vector<domain::RecipeIngredient> getIngredients(
        const std::string& orgId, const std::string& targetId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = recipes_.find({orgId, targetId});
        if (it == recipes_.end()) return {};
        return it->second;
    }

    void setRecipe(const std::string& orgId, const std::string& targetId,
                   std::vector<domain::RecipeIngredient> ingredients) {
        std::lock_guard<std::mutex> lock(mutex_);
        recipes_[{orgId, targetId}] = std::move(ingredients);
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::vector<domain::RecipeIngredient>> recipes_;
};

} // namespace inventory::adapters::secondary
