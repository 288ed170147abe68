#pragma once

#include <cstdint>
#include <cstdlib>

namespace flatguard {
namespace pnl {

// Result of applying one signed fill to a (quantity, average price) pair.
struct FillEffect {
  std::int64_t quantity{0};
  double average_price{0.0};
  double realized_pnl{0.0};        // Currency, already multiplied
  std::int64_t closed_quantity{0};
};

// -----------------------------------------------------------------------------
// applySignedFill(quantity, average_price, signed_fill, price, multiplier)
// -----------------------------------------------------------------------------
// @brief  Weighted-average position math for one fill.
//
// @details
// Three cases, decided by the fill's direction relative to the position:
//
//   Case 1: increasing (or opening from flat)
//     new_avg = (|qty| * avg + |fill| * price) / (|qty| + |fill|)
//   Case 2: reducing without crossing zero
//     realized += closed * (price - avg) * dir * multiplier; avg unchanged
//     (avg resets to 0 when the position lands exactly on flat)
//   Case 3: crossing zero
//     close the whole position as in Case 2, open the remainder at price
//
// dir is +1 for a long position and -1 for a short one.
// -----------------------------------------------------------------------------
inline FillEffect applySignedFill(std::int64_t quantity, double average_price,
                                  std::int64_t signed_fill, double price,
                                  double multiplier) {
  FillEffect effect;

  if (quantity == 0) {
    effect.quantity = signed_fill;
    effect.average_price = signed_fill == 0 ? 0.0 : price;
    return effect;
  }

  const bool same_direction =
      (quantity > 0 && signed_fill > 0) || (quantity < 0 && signed_fill < 0);

  if (same_direction) {
    const double abs_qty = static_cast<double>(std::llabs(quantity));
    const double abs_fill = static_cast<double>(std::llabs(signed_fill));
    effect.quantity = quantity + signed_fill;
    effect.average_price =
        (abs_qty * average_price + abs_fill * price) / (abs_qty + abs_fill);
    return effect;
  }

  const std::int64_t abs_current = std::llabs(quantity);
  const std::int64_t abs_fill = std::llabs(signed_fill);
  const double dir = quantity > 0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    effect.closed_quantity = abs_fill;
    effect.realized_pnl = static_cast<double>(abs_fill) *
                          (price - average_price) * dir * multiplier;
    effect.quantity = quantity + signed_fill;
    effect.average_price = effect.quantity == 0 ? 0.0 : average_price;
    return effect;
  }

  effect.closed_quantity = abs_current;
  effect.realized_pnl = static_cast<double>(abs_current) *
                        (price - average_price) * dir * multiplier;
  effect.quantity = quantity + signed_fill;
  effect.average_price = price;
  return effect;
}

// (last - avg) * qty * multiplier. Signed qty makes the short case fall out.
inline double unrealizedPnl(std::int64_t quantity, double average_price,
                            double last_price, double multiplier) {
  if (quantity == 0) {
    return 0.0;
  }
  return (last_price - average_price) * static_cast<double>(quantity) *
         multiplier;
}

}  // namespace pnl
}  // namespace flatguard
