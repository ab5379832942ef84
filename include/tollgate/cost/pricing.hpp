#pragma once

#include "tollgate/config/schema.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace tollgate::cost {

using config::ModelPrice;

/// USD per million tokens, per model.
class PriceTable {
public:
  PriceTable();
  explicit PriceTable(const config::PricingConfig &pricing);

  /// "vendor/model" is looked up as "model" first, then as written, then the default applies.
  [[nodiscard]] ModelPrice price_for(const std::string &model) const;
  [[nodiscard]] bool has_model(const std::string &model) const;
  [[nodiscard]] double estimate(const std::string &model, std::uint64_t input_tokens,
                                std::uint64_t output_tokens) const;

  void set(const std::string &model, ModelPrice price);
  void set_default(ModelPrice price) { default_price_ = price; }
  [[nodiscard]] const ModelPrice &default_price() const { return default_price_; }
  [[nodiscard]] const std::map<std::string, ModelPrice> &models() const { return models_; }

private:
  std::map<std::string, ModelPrice> models_;
  ModelPrice default_price_;
};

[[nodiscard]] std::map<std::string, ModelPrice> builtin_prices();

} // namespace tollgate::cost
