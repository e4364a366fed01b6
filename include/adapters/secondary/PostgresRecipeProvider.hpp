#pragma once

#include "ports/output/IRecipeProvider.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Техкарты из таблицы recipe_ingredients
 */
class PostgresRecipeProvider : public ports::output::IRecipeProvider {
public:
    explicit PostgresRecipeProvider(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(R"(
                CREATE TABLE IF NOT EXISTS recipe_ingredients (
                    org_id TEXT NOT NULL,
                    target_id TEXT NOT NULL,
                    position INT NOT NULL,
                    item_id TEXT NOT NULL,
                    qty_per_unit NUMERIC NOT NULL CHECK (qty_per_unit >= 0),
                    modifier_option_id TEXT,
                    PRIMARY KEY (org_id, target_id, position)
                )
            )");
            t.commit();
            std::cout << "[PostgresRecipeProvider] Created" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRecipeProvider] Schema init failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::RecipeIngredient> getIngredients(
        const std::string& orgId, const std::string& targetId) override
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT item_id, qty_per_unit::text, modifier_option_id FROM recipe_ingredients "
                "WHERE org_id = $1 AND target_id = $2 ORDER BY position",
                orgId, targetId);
            t.commit();

            std::vector<domain::RecipeIngredient> ingredients;
            for (const auto& row : r) {
                domain::RecipeIngredient ingredient;
                ingredient.itemId = row[0].as<std::string>();
                ingredient.qtyPerUnit = domain::Decimal::parse(row[1].as<std::string>());
                if (!row[2].is_null()) ingredient.modifierOptionId = row[2].as<std::string>();
                ingredients.push_back(std::move(ingredient));
            }
            return ingredients;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRecipeProvider] getIngredients failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace inventory::adapters::secondary
