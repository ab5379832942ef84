#include "tollgate/cost/pricing.hpp"

namespace tollgate::cost {

namespace {

constexpr double TOKENS_PER_PRICE_UNIT = 1'000'000.0;

ModelPrice per_million(double input, double output) {
  return ModelPrice{.input_per_million = input, .output_per_million = output};
}

} // namespace

std::map<std::string, ModelPrice> builtin_prices() {
  return {
      {"gpt-4o", per_million(2.50, 10.00)},
      {"gpt-4o-mini", per_million(0.15, 0.60)},
      {"gpt-4-turbo", per_million(10.00, 30.00)},
      {"gpt-3.5-turbo", per_million(0.50, 1.50)},
      {"claude-3-5-sonnet-20241022", per_million(3.00, 15.00)},
      {"claude-3-5-haiku-20241022", per_million(0.80, 4.00)},
      {"claude-3-opus-20240229", per_million(15.00, 75.00)},
      // OpenRouter proxies carry a markup.
      {"anthropic/claude-3-5-sonnet-20241022", per_million(3.00, 15.00)},
      {"anthropic/claude-3-5-haiku-20241022", per_million(1.00, 5.00)},
  };
}

PriceTable::PriceTable() : models_(builtin_prices()), default_price_(per_million(2.00, 8.00)) {}

PriceTable::PriceTable(const config::PricingConfig &pricing)
    : models_(builtin_prices()), default_price_(pricing.default_price) {
  for (const auto &[model, price] : pricing.models) {
    models_[model] = price;
  }
}

ModelPrice PriceTable::price_for(const std::string &model) const {
  if (const auto slash = model.rfind('/'); slash != std::string::npos) {
    if (const auto it = models_.find(model.substr(slash + 1)); it != models_.end()) {
      return it->second;
    }
  }
  if (const auto it = models_.find(model); it != models_.end()) {
    return it->second;
  }
  return default_price_;
}

bool PriceTable::has_model(const std::string &model) const {
  const auto slash = model.rfind('/');
  return models_.contains(model) ||
         (slash != std::string::npos && models_.contains(model.substr(slash + 1)));
}

double PriceTable::estimate(const std::string &model, const std::uint64_t input_tokens,
                            const std::uint64_t output_tokens) const {
  const ModelPrice price = price_for(model);
  return static_cast<double>(input_tokens) / TOKENS_PER_PRICE_UNIT * price.input_per_million +
         static_cast<double>(output_tokens) / TOKENS_PER_PRICE_UNIT * price.output_per_million;
}

void PriceTable::set(const std::string &model, ModelPrice price) { models_[model] = price; }

} // namespace tollgate::cost
